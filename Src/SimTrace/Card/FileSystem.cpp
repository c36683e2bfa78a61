/**
 * @file FileSystem.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card file system tree implementation
 * @version 0.1
 * @date 2026-03-03
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Card/FileSystem.h"

using namespace simtrace;
using namespace simtrace::buffer;

namespace
{
    etl::string_view viewOf(const etl::istring& text)
    {
        return etl::string_view(text.data(), text.size());
    }
}

FileSystem::FileSystem()
    : nodes()
{
    FileNode mf;
    mf.parent = INVALID_NODE;
    mf.fid = FID_MF;
    mf.sfi = 0;
    mf.type = FileType::MasterFile;
    mf.lifeCycle = LifeCycle::Activated;
    mf.name.assign("MF");
    nodes.push_back(mf);
}

etl::expected<NodeId, error::Error> FileSystem::addFile(
    NodeId parent,
    uint16_t fid,
    etl::string_view name,
    FileType type,
    uint8_t sfi)
{
    if (!contains(parent))
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::FileNotFound));
    }

    if (!nodes[parent].isDirectory())
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::NotADirectory));
    }

    if (type == FileType::MasterFile || type == FileType::ApplicationDf || fid == FID_MF || fid == FID_CURRENT_ADF)
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::InvalidPath));
    }

    if (findChild(parent, fid).has_value())
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::DuplicateFile));
    }

    FileNode fileNode;
    fileNode.parent = parent;
    fileNode.fid = fid;
    fileNode.sfi = sfi;
    fileNode.type = type;
    fileNode.lifeCycle = LifeCycle::Activated;
    fileNode.name.assign(name.begin(), name.end());

    return appendNode(fileNode);
}

etl::expected<NodeId, error::Error> FileSystem::addApplication(
    uint16_t fid,
    etl::string_view name,
    const etl::ivector<uint8_t>& aid)
{
    if (aid.empty() || aid.size() > AID_MAX)
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::InvalidPath));
    }

    if (findApplication(aid).has_value())
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::DuplicateFile));
    }

    FileNode adf;
    adf.parent = root();
    adf.fid = fid;
    adf.sfi = 0;
    adf.type = FileType::ApplicationDf;
    adf.lifeCycle = LifeCycle::Activated;
    adf.name.assign(name.begin(), name.end());
    adf.aid.assign(aid.begin(), aid.end());

    return appendNode(adf);
}

etl::expected<NodeId, error::Error> FileSystem::appendNode(const FileNode& fileNode)
{
    if (nodes.full())
    {
        return etl::unexpected(error::Error::fromCardModel(error::CardModelError::CapacityExceeded));
    }

    nodes.push_back(fileNode);
    return static_cast<NodeId>(nodes.size() - 1);
}

etl::optional<NodeId> FileSystem::parentOf(NodeId id) const
{
    if (!contains(id) || nodes[id].parent == INVALID_NODE)
    {
        return etl::nullopt;
    }
    return nodes[id].parent;
}

etl::optional<NodeId> FileSystem::findChild(NodeId parent, uint16_t fid) const
{
    for (size_t i = 1; i < nodes.size(); ++i)
    {
        // ADFs hang below the MF but are not selectable by FID from there
        if (nodes[i].parent == parent && nodes[i].fid == fid && nodes[i].type != FileType::ApplicationDf)
        {
            return static_cast<NodeId>(i);
        }
    }
    return etl::nullopt;
}

etl::optional<NodeId> FileSystem::findChildByName(NodeId parent, etl::string_view name) const
{
    for (size_t i = 1; i < nodes.size(); ++i)
    {
        if (nodes[i].parent == parent && viewOf(nodes[i].name) == name)
        {
            return static_cast<NodeId>(i);
        }
    }
    return etl::nullopt;
}

etl::optional<NodeId> FileSystem::findChildBySfi(NodeId parent, uint8_t sfi) const
{
    if (sfi == 0)
    {
        return etl::nullopt;
    }

    for (size_t i = 1; i < nodes.size(); ++i)
    {
        if (nodes[i].parent == parent && nodes[i].sfi == sfi && nodes[i].isElementary())
        {
            return static_cast<NodeId>(i);
        }
    }
    return etl::nullopt;
}

etl::optional<NodeId> FileSystem::findApplication(const etl::ivector<uint8_t>& aidPrefix) const
{
    if (aidPrefix.empty())
    {
        return etl::nullopt;
    }

    for (size_t i = 1; i < nodes.size(); ++i)
    {
        const FileNode& candidate = nodes[i];
        if (candidate.type != FileType::ApplicationDf)
        {
            continue;
        }

        const size_t length = candidate.aid.size() < aidPrefix.size() ? candidate.aid.size() : aidPrefix.size();
        bool match = true;
        for (size_t j = 0; j < length; ++j)
        {
            if (candidate.aid[j] != aidPrefix[j])
            {
                match = false;
                break;
            }
        }

        if (match)
        {
            return static_cast<NodeId>(i);
        }
    }
    return etl::nullopt;
}

etl::optional<NodeId> FileSystem::findByPath(etl::string_view path) const
{
    NodeId current = INVALID_NODE;
    size_t start = 0;

    while (start <= path.size())
    {
        size_t end = start;
        while (end < path.size() && path[end] != '/')
        {
            ++end;
        }

        const etl::string_view component(path.data() + start, end - start);
        if (current == INVALID_NODE)
        {
            if (component != viewOf(nodes[root()].name))
            {
                return etl::nullopt;
            }
            current = root();
        }
        else
        {
            auto child = findChildByName(current, component);
            if (!child.has_value())
            {
                return etl::nullopt;
            }
            current = child.value();
        }

        start = end + 1;
    }

    if (current == INVALID_NODE)
    {
        return etl::nullopt;
    }
    return current;
}

void FileSystem::pathString(NodeId id, etl::istring& out) const
{
    out.clear();
    if (!contains(id))
    {
        return;
    }

    // Collect ancestors leaf first
    NodeId chain[PATH_DEPTH_MAX];
    size_t depth = 0;
    NodeId current = id;
    while (current != INVALID_NODE && depth < PATH_DEPTH_MAX)
    {
        chain[depth++] = current;
        current = nodes[current].parent;
    }

    for (size_t i = depth; i > 0; --i)
    {
        const FileNode& element = nodes[chain[i - 1]];
        if (i != depth)
        {
            out.append("/");
        }
        out.append(element.name);
    }
}
