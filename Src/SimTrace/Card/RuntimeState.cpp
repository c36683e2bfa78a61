/**
 * @file RuntimeState.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Reconstructed card state implementation
 * @version 0.1
 * @date 2026-03-04
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Card/RuntimeState.h"
#include "Utils/Logging.h"

using namespace simtrace;
using namespace simtrace::buffer;

namespace
{
    bool containsKey(const etl::ivector<uint8_t>& keys, uint8_t keyReference)
    {
        for (size_t i = 0; i < keys.size(); ++i)
        {
            if (keys[i] == keyReference)
            {
                return true;
            }
        }
        return false;
    }

    void addKey(etl::ivector<uint8_t>& keys, uint8_t keyReference)
    {
        if (!containsKey(keys, keyReference) && !keys.full())
        {
            keys.push_back(keyReference);
        }
    }

    void removeKey(etl::ivector<uint8_t>& keys, uint8_t keyReference)
    {
        for (size_t i = 0; i < keys.size(); ++i)
        {
            if (keys[i] == keyReference)
            {
                keys.erase(keys.begin() + i);
                return;
            }
        }
    }
}

RuntimeState::RuntimeState()
    : fs()
{
    reset();
}

RuntimeState::RuntimeState(const FileSystem& fileSystem)
    : fs(fileSystem)
{
    reset();
}

void RuntimeState::reset()
{
    for (uint8_t channel = 0; channel < LOGICAL_CHANNELS_MAX; ++channel)
    {
        channels[channel] = ChannelState();
        channels[channel].selectedFile = fs.root();
    }
    channels[0].open = true;
    verifiedGlobalPins.clear();
}

void RuntimeState::reset(uint8_t channel)
{
    if (!isValidChannel(channel))
    {
        return;
    }

    const bool wasOpen = channels[channel].open;
    channels[channel] = ChannelState();
    channels[channel].selectedFile = fs.root();
    channels[channel].open = wasOpen || channel == 0;
}

bool RuntimeState::isOpen(uint8_t channel) const
{
    return isValidChannel(channel) && channels[channel].open;
}

etl::expected<void, error::Error> RuntimeState::openChannel(uint8_t channel, uint8_t origin)
{
    if (!isValidChannel(channel) || channel == 0 || !isValidChannel(origin))
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::InvalidChannel));
    }

    if (channels[channel].open)
    {
        LOG_DEBUG("Channel %u opened again", static_cast<unsigned>(channel));
    }

    ChannelState opened;
    if (origin != 0 && channels[origin].open)
    {
        opened = channels[origin];
        opened.recordPointer = 0;
    }
    else
    {
        opened.selectedFile = fs.root();
    }
    opened.open = true;
    channels[channel] = opened;

    return {};
}

etl::expected<void, error::Error> RuntimeState::closeChannel(uint8_t channel)
{
    if (!isValidChannel(channel) || channel == 0)
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::InvalidChannel));
    }

    if (!channels[channel].open)
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::ChannelNotOpen));
    }

    channels[channel] = ChannelState();
    channels[channel].selectedFile = fs.root();
    return {};
}

NodeId RuntimeState::currentNode(uint8_t channel) const
{
    if (!isValidChannel(channel))
    {
        return fs.root();
    }
    return channels[channel].selectedFile;
}

NodeId RuntimeState::currentDf(uint8_t channel) const
{
    const NodeId current = currentNode(channel);
    if (fs.node(current).isDirectory())
    {
        return current;
    }
    return fs.node(current).parent;
}

etl::expected<void, error::Error> RuntimeState::checkChannel(uint8_t channel) const
{
    if (!isValidChannel(channel))
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::InvalidChannel));
    }
    if (!channels[channel].open)
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::ChannelNotOpen));
    }
    return {};
}

void RuntimeState::moveCursor(uint8_t channel, NodeId target)
{
    ChannelState& state = channels[channel];

    if (fs.node(target).type == FileType::ApplicationDf && state.selectedAdf != target)
    {
        state.selectedAdf = target;
        state.verifiedLocalPins.clear();
    }

    if (state.selectedFile != target)
    {
        state.recordPointer = 0;
    }
    state.selectedFile = target;
}

etl::expected<NodeId, error::Error> RuntimeState::selectChild(uint8_t channel, uint16_t fid)
{
    auto checked = checkChannel(channel);
    if (!checked)
    {
        return etl::unexpected(checked.error());
    }

    auto child = fs.findChild(currentDf(channel), fid);
    if (!child.has_value())
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::FileNotFound));
    }

    moveCursor(channel, child.value());
    return child.value();
}

etl::expected<NodeId, error::Error> RuntimeState::selectByFileId(uint8_t channel, uint16_t fid)
{
    auto checked = checkChannel(channel);
    if (!checked)
    {
        return etl::unexpected(checked.error());
    }

    etl::optional<NodeId> target;
    const NodeId df = currentDf(channel);

    if (fid == FID_MF)
    {
        target = fs.root();
    }
    else if (fid == FID_CURRENT_ADF)
    {
        if (channels[channel].selectedAdf == INVALID_NODE)
        {
            return etl::unexpected(error::Error::fromCardModel(error::CardModelError::NoApplicationSelected));
        }
        target = channels[channel].selectedAdf;
    }
    else if (df != fs.root() && fs.node(df).fid == fid)
    {
        target = df;
    }
    else
    {
        target = fs.findChild(df, fid);

        const etl::optional<NodeId> parent = fs.parentOf(df);
        if (!target.has_value() && parent.has_value())
        {
            if (fs.node(parent.value()).fid == fid)
            {
                target = parent.value();
            }
            else
            {
                // Only DFs are reachable as siblings
                auto sibling = fs.findChild(parent.value(), fid);
                if (sibling.has_value() && fs.node(sibling.value()).isDirectory())
                {
                    target = sibling;
                }
            }
        }
    }

    if (!target.has_value())
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::FileNotFound));
    }

    moveCursor(channel, target.value());
    return target.value();
}

etl::expected<NodeId, error::Error> RuntimeState::selectParent(uint8_t channel)
{
    auto checked = checkChannel(channel);
    if (!checked)
    {
        return etl::unexpected(checked.error());
    }

    auto parent = fs.parentOf(currentDf(channel));
    if (!parent.has_value())
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::NoParent));
    }

    moveCursor(channel, parent.value());
    return parent.value();
}

etl::expected<NodeId, error::Error> RuntimeState::walkPath(NodeId start, const uint16_t* fids, size_t count) const
{
    NodeId current = start;
    for (size_t i = 0; i < count; ++i)
    {
        if (!fs.node(current).isDirectory())
        {
            return etl::unexpected(error::Error::fromCardModel(error::CardModelError::NotADirectory));
        }

        auto child = fs.findChild(current, fids[i]);
        if (!child.has_value())
        {
            return etl::unexpected(error::Error::fromCardModel(error::CardModelError::FileNotFound));
        }
        current = child.value();
    }
    return current;
}

etl::expected<NodeId, error::Error> RuntimeState::selectAbsolute(uint8_t channel, const etl::ivector<uint16_t>& path)
{
    auto checked = checkChannel(channel);
    if (!checked)
    {
        return etl::unexpected(checked.error());
    }

    NodeId start = fs.root();
    size_t first = 0;

    if (!path.empty() && path[0] == FID_MF)
    {
        first = 1;
    }
    else if (!path.empty() && path[0] == FID_CURRENT_ADF)
    {
        if (channels[channel].selectedAdf == INVALID_NODE)
        {
            return etl::unexpected(error::Error::fromCardModel(error::CardModelError::NoApplicationSelected));
        }
        start = channels[channel].selectedAdf;
        first = 1;
    }

    auto target = walkPath(start, path.data() + first, path.size() - first);
    if (!target)
    {
        return target;
    }

    moveCursor(channel, target.value());
    return target.value();
}

etl::expected<NodeId, error::Error> RuntimeState::selectRelative(uint8_t channel, const etl::ivector<uint16_t>& path)
{
    auto checked = checkChannel(channel);
    if (!checked)
    {
        return etl::unexpected(checked.error());
    }

    if (path.empty())
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::InvalidPath));
    }

    auto target = walkPath(currentDf(channel), path.data(), path.size());
    if (!target)
    {
        return target;
    }

    moveCursor(channel, target.value());
    return target.value();
}

etl::expected<NodeId, error::Error> RuntimeState::selectApplication(uint8_t channel, const etl::ivector<uint8_t>& aid)
{
    auto checked = checkChannel(channel);
    if (!checked)
    {
        return etl::unexpected(checked.error());
    }

    auto adf = fs.findApplication(aid);
    if (!adf.has_value())
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::ApplicationNotFound));
    }

    moveCursor(channel, adf.value());
    return adf.value();
}

etl::expected<NodeId, error::Error> RuntimeState::selectBySfi(uint8_t channel, uint8_t sfi)
{
    auto checked = checkChannel(channel);
    if (!checked)
    {
        return etl::unexpected(checked.error());
    }

    auto ef = fs.findChildBySfi(currentDf(channel), sfi);
    if (!ef.has_value())
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::FileNotFound));
    }

    moveCursor(channel, ef.value());
    return ef.value();
}

etl::optional<ApplicationDescriptor> RuntimeState::applicationContext(uint8_t channel) const
{
    if (!isOpen(channel) || channels[channel].selectedAdf == INVALID_NODE)
    {
        return etl::nullopt;
    }

    const FileNode& adf = fs.node(channels[channel].selectedAdf);

    ApplicationDescriptor descriptor;
    descriptor.name = adf.name;
    descriptor.aid.assign(adf.aid.begin(), adf.aid.end());
    descriptor.adf = channels[channel].selectedAdf;
    return descriptor;
}

uint8_t RuntimeState::recordPointer(uint8_t channel) const
{
    if (!isValidChannel(channel))
    {
        return 0;
    }
    return channels[channel].recordPointer;
}

void RuntimeState::setRecordPointer(uint8_t channel, uint8_t record)
{
    if (isValidChannel(channel))
    {
        channels[channel].recordPointer = record;
    }
}

void RuntimeState::markPinVerified(uint8_t channel, uint8_t keyReference)
{
    if (!isValidChannel(channel))
    {
        return;
    }

    if (isLocalKeyReference(keyReference))
    {
        addKey(channels[channel].verifiedLocalPins, keyReference);
    }
    else
    {
        addKey(verifiedGlobalPins, keyReference);
    }
}

void RuntimeState::clearPinVerified(uint8_t channel, uint8_t keyReference)
{
    if (!isValidChannel(channel))
    {
        return;
    }

    if (isLocalKeyReference(keyReference))
    {
        removeKey(channels[channel].verifiedLocalPins, keyReference);
    }
    else
    {
        removeKey(verifiedGlobalPins, keyReference);
    }
}

bool RuntimeState::isPinVerified(uint8_t channel, uint8_t keyReference) const
{
    if (!isValidChannel(channel))
    {
        return false;
    }

    if (isLocalKeyReference(keyReference))
    {
        return containsKey(channels[channel].verifiedLocalPins, keyReference);
    }
    return containsKey(verifiedGlobalPins, keyReference);
}
