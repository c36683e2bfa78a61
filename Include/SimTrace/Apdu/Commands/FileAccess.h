/**
 * @file FileAccess.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Shared helpers for commands operating on an EF
 * @version 0.1
 * @date 2026-03-05
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "SimTrace/Card/RuntimeState.h"
#include "Error/Error.h"
#include <etl/expected.h>
#include <etl/string.h>

namespace simtrace
{
    namespace file_access
    {
        /**
         * @brief Resolve the EF a command operates on
         *
         * With an SFI the EF is looked up in the current DF and, when the card
         * accepted the command, becomes the current EF. Without SFI the
         * current file is used and must be an EF.
         */
        inline etl::expected<NodeId, error::Error> resolveEf(
            RuntimeState& state,
            uint8_t lchan,
            uint8_t sfi,
            bool accepted)
        {
            if (sfi != 0)
            {
                if (accepted)
                {
                    return state.selectBySfi(lchan, sfi);
                }

                auto ef = state.fileSystem().findChildBySfi(state.currentDf(lchan), sfi);
                if (!ef.has_value())
                {
                    return etl::unexpected(error::Error::fromCardModel(error::CardModelError::FileNotFound));
                }
                return ef.value();
            }

            const NodeId current = state.currentNode(lchan);
            if (!state.fileSystem().node(current).isElementary())
            {
                return etl::unexpected(error::Error::fromCardModel(error::CardModelError::FileNotFound));
            }
            return current;
        }

        inline const char* fileTypeName(FileType type)
        {
            switch (type)
            {
                case FileType::MasterFile:
                    return "MF";
                case FileType::DedicatedFile:
                    return "DF";
                case FileType::ApplicationDf:
                    return "ADF";
                case FileType::TransparentEf:
                    return "transparent EF";
                case FileType::LinearFixedEf:
                    return "linear fixed EF";
                case FileType::CyclicEf:
                    return "cyclic EF";
                case FileType::BerTlvEf:
                    return "BER-TLV EF";
                default:
                    return "file";
            }
        }

        /**
         * @brief Collect 16-bit FIDs from a path given as bytes
         *
         * @return false Odd length, empty or too deep
         */
        template <typename TPath>
        inline bool collectPath(const etl::ivector<uint8_t>& data, TPath& path)
        {
            if (data.empty() || (data.size() % 2) != 0 || data.size() / 2 > path.capacity())
            {
                return false;
            }

            path.clear();
            for (size_t i = 0; i < data.size(); i += 2)
            {
                path.push_back(static_cast<uint16_t>((data[i] << 8) | data[i + 1]));
            }
            return true;
        }
    }

} // namespace simtrace
