/**
 * @file FileSystem.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card file system tree (MF, DF, ADF, EF)
 * @version 0.1
 * @date 2026-03-03
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/optional.h>
#include <etl/expected.h>
#include <cstdint>

#include "SimTrace/BufferSizes.h"
#include "Error/Error.h"

namespace simtrace
{
    using NodeId = uint16_t;

    constexpr NodeId INVALID_NODE = 0xFFFF;

    /**
     * @brief File identifiers with a fixed meaning
     */
    constexpr uint16_t FID_MF = 0x3F00;
    constexpr uint16_t FID_CURRENT_ADF = 0x7FFF;

    /**
     * @brief Type of a file system node
     */
    enum class FileType : uint8_t
    {
        MasterFile,
        DedicatedFile,
        ApplicationDf,
        TransparentEf,
        LinearFixedEf,
        CyclicEf,
        BerTlvEf
    };

    /**
     * @brief Life cycle state of a file (ETSI TS 102 221 §11.1.14 / 11.1.15)
     */
    enum class LifeCycle : uint8_t
    {
        Activated,
        Deactivated
    };

    /**
     * @brief One file or application in the tree
     */
    struct FileNode
    {
        NodeId parent;
        uint16_t fid;
        uint8_t sfi;                                     // 0 when the file has no SFI
        FileType type;
        LifeCycle lifeCycle;
        etl::string<buffer::FILE_NAME_MAX> name;
        etl::vector<uint8_t, buffer::AID_MAX> aid;       // ADF only

        bool isDirectory() const
        {
            return type == FileType::MasterFile || type == FileType::DedicatedFile || type == FileType::ApplicationDf;
        }

        bool isElementary() const
        {
            return !isDirectory();
        }

        bool isRecordBased() const
        {
            return type == FileType::LinearFixedEf || type == FileType::CyclicEf;
        }
    };

    /**
     * @brief Hierarchical card file system
     *
     * Nodes are stored in an arena and referenced by NodeId. The MF is
     * always node 0 and nodes are never removed, so a NodeId stays valid
     * for the lifetime of the tree.
     */
    class FileSystem
    {
    public:
        /**
         * @brief Construct a root-only tree (MF)
         */
        FileSystem();

        NodeId root() const
        {
            return 0;
        }

        size_t size() const
        {
            return nodes.size();
        }

        bool contains(NodeId id) const
        {
            return id < nodes.size();
        }

        /**
         * @brief Add a DF or EF below a directory
         *
         * @param parent Parent directory
         * @param fid File identifier (unique among the parent's children)
         * @param name Display name
         * @param type File type (not MasterFile / ApplicationDf)
         * @param sfi Short file identifier, 0 for none
         * @return etl::expected<NodeId, error::Error> New node or error
         */
        etl::expected<NodeId, error::Error> addFile(
            NodeId parent,
            uint16_t fid,
            etl::string_view name,
            FileType type,
            uint8_t sfi = 0);

        /**
         * @brief Add an application DF (ADF) below the MF
         *
         * @param fid File identifier used for the path display
         * @param name Display name
         * @param aid Application identifier
         * @return etl::expected<NodeId, error::Error> New node or error
         */
        etl::expected<NodeId, error::Error> addApplication(
            uint16_t fid,
            etl::string_view name,
            const etl::ivector<uint8_t>& aid);

        const FileNode& node(NodeId id) const
        {
            return nodes[id];
        }

        FileNode& node(NodeId id)
        {
            return nodes[id];
        }

        /**
         * @brief Parent of a node, nullopt for the MF
         */
        etl::optional<NodeId> parentOf(NodeId id) const;

        etl::optional<NodeId> findChild(NodeId parent, uint16_t fid) const;

        etl::optional<NodeId> findChildByName(NodeId parent, etl::string_view name) const;

        etl::optional<NodeId> findChildBySfi(NodeId parent, uint8_t sfi) const;

        /**
         * @brief Find an ADF by AID
         *
         * The AIDs are compared over the length of the shorter one: ISO 7816-4
         * allows right-truncated AIDs in SELECT by DF name, and the profile
         * stores applications by RID + application code only.
         *
         * @param aidPrefix Full or truncated AID
         */
        etl::optional<NodeId> findApplication(const etl::ivector<uint8_t>& aidPrefix) const;

        /**
         * @brief Resolve a '/'-separated name path, e.g. "MF/DF_TELECOM/EF_ADN"
         */
        etl::optional<NodeId> findByPath(etl::string_view path) const;

        /**
         * @brief Write the fully qualified name path of a node ("MF/ADF_USIM/EF_IMSI")
         */
        void pathString(NodeId id, etl::istring& out) const;

    private:
        etl::expected<NodeId, error::Error> appendNode(const FileNode& fileNode);

        etl::vector<FileNode, buffer::FS_NODES_MAX> nodes;
    };

} // namespace simtrace
