/**
 * @file SelectCommand.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief SELECT FILE implementation
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Apdu/Commands/SelectCommand.h"
#include "SimTrace/Apdu/Commands/FileAccess.h"
#include "SimTrace/Apdu/CommandRegistry.h"
#include "Utils/Hex.h"

#include <cstdio>

using namespace simtrace;

SelectCommand::SelectCommand(const CommandDescriptor& descriptor, const ApduExchange& exchange, uint8_t lchan)
    : ApduCommand(descriptor, exchange, lchan)
    , mode(SelectMode::ByFileId)
    , fid(FID_MF)
{
}

etl::expected<void, error::Error> SelectCommand::parseFields()
{
    const etl::ivector<uint8_t>& data = exchange.commandData;

    switch (exchange.p1)
    {
        case 0x00:
            mode = SelectMode::ByFileId;
            // No data selects the MF
            if (data.empty())
            {
                fid = FID_MF;
                return {};
            }
            break;

        case 0x01:
            mode = SelectMode::ChildDf;
            break;

        case 0x02:
            mode = SelectMode::ChildEf;
            break;

        case 0x03:
            mode = SelectMode::ParentDf;
            return {};

        case 0x04:
            mode = SelectMode::ByDfName;
            if (data.empty() || data.size() > buffer::AID_MAX)
            {
                return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
            }
            aid.assign(data.begin(), data.end());
            return {};

        case 0x08:
        case 0x09:
            mode = exchange.p1 == 0x08 ? SelectMode::PathFromMf : SelectMode::PathFromCurrentDf;
            if (!file_access::collectPath(data, path))
            {
                return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
            }
            return {};

        default:
            return etl::unexpected(error::Error::fromDecode(error::DecodeError::InvalidParameter));
    }

    if (data.size() != 2)
    {
        return etl::unexpected(error::Error::fromDecode(error::DecodeError::WrongLength));
    }
    fid = utils::readUint16(data.data());
    return {};
}

etl::expected<NodeId, error::Error> SelectCommand::resolve(RuntimeState& state)
{
    switch (mode)
    {
        case SelectMode::ByFileId:
            return state.selectByFileId(lchan, fid);

        case SelectMode::ChildDf:
        case SelectMode::ChildEf:
        {
            auto child = state.fileSystem().findChild(state.currentDf(lchan), fid);
            if (!child.has_value())
            {
                return etl::unexpected(error::Error::fromCardModel(error::CardModelError::FileNotFound));
            }
            if (state.fileSystem().node(child.value()).isDirectory() != (mode == SelectMode::ChildDf))
            {
                return etl::unexpected(error::Error::fromCardModel(error::CardModelError::NotADirectory));
            }
            return state.selectChild(lchan, fid);
        }

        case SelectMode::ParentDf:
            return state.selectParent(lchan);

        case SelectMode::ByDfName:
            return state.selectApplication(lchan, aid);

        case SelectMode::PathFromMf:
            return state.selectAbsolute(lchan, path);

        case SelectMode::PathFromCurrentDf:
            return state.selectRelative(lchan, path);

        default:
            return etl::unexpected(error::Error::fromDecode(error::DecodeError::InvalidParameter));
    }
}

void SelectCommand::describeTarget(etl::istring& out) const
{
    char text[8];

    switch (mode)
    {
        case SelectMode::ByFileId:
        case SelectMode::ChildDf:
        case SelectMode::ChildEf:
            std::snprintf(text, sizeof(text), "%04X", static_cast<unsigned>(fid));
            out.assign(text);
            break;

        case SelectMode::ParentDf:
            out.assign("parent DF");
            break;

        case SelectMode::ByDfName:
            out.assign("AID ");
            utils::appendHex(out, aid);
            break;

        case SelectMode::PathFromMf:
        case SelectMode::PathFromCurrentDf:
            out.assign(mode == SelectMode::PathFromMf ? "3F00" : ".");
            for (size_t i = 0; i < path.size(); ++i)
            {
                std::snprintf(text, sizeof(text), "/%04X", static_cast<unsigned>(path[i]));
                out.append(text);
            }
            break;

        default:
            out.assign("?");
            break;
    }
}

void SelectCommand::processOnChannel(RuntimeState& state)
{
    etl::string<64> target;
    describeTarget(target);

    if (mode == SelectMode::ByDfName)
    {
        etl::string<buffer::COLUMN_ID_MAX> shortAid;
        utils::appendHex(shortAid, aid);
        setColId("%s", shortAid.c_str());
    }
    else if (mode == SelectMode::PathFromMf || mode == SelectMode::PathFromCurrentDf)
    {
        setColId("%04X", static_cast<unsigned>(path.back()));
    }
    else if (mode == SelectMode::ParentDf)
    {
        setColId("..");
    }
    else
    {
        setColId("%04X", static_cast<unsigned>(fid));
    }

    if (!cardAccepted())
    {
        appendProcessed("selection of %s rejected by card", target.c_str());
        return;
    }

    auto selected = resolve(state);
    if (!selected)
    {
        appendProcessed("lookup of %s failed (%s)", target.c_str(), selected.error().toString().c_str());
        return;
    }

    setPath(state, selected.value());

    const FileNode& node = state.fileSystem().node(selected.value());
    appendProcessed("selected %s (%s)", node.name.c_str(), file_access::fileTypeName(node.type));
}
