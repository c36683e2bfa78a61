/**
 * @file CardProfile.h
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Static description of the files and applications of a card
 * @version 0.1
 * @date 2026-03-03
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/string_view.h>
#include <etl/expected.h>
#include <cstddef>
#include <cstdint>

#include "FileSystem.h"
#include "Error/Error.h"

namespace simtrace
{
    /**
     * @brief One row of a card profile table
     *
     * Rows are listed depth first. A row with depth N is a child of the
     * closest preceding row with depth N-1; depth 1 rows hang below the MF.
     * ADF rows must have depth 1 and carry the AID as hex text.
     */
    struct FileRow
    {
        uint8_t depth;
        uint16_t fid;
        const char* name;
        FileType type;
        uint8_t sfi;
        const char* aidHex;
    };

    /**
     * @brief Read-only card profile
     *
     * The profile is handed to the runtime state at startup and is never
     * modified; populate() builds a FileSystem instance from it.
     */
    class CardProfile
    {
    public:
        CardProfile(etl::string_view name, const FileRow* rows, size_t count);

        /**
         * @brief Generic UICC with SIM (DF.GSM), USIM and ISIM applications
         */
        static const CardProfile& uiccSimUsimIsim();

        /**
         * @brief Profile containing only the MF
         */
        static const CardProfile& empty();

        etl::string_view name() const
        {
            return profileName;
        }

        size_t size() const
        {
            return count;
        }

        /**
         * @brief Add all rows of the profile to a file system
         *
         * @param fileSystem Tree to populate (usually root-only)
         * @return etl::expected<void, error::Error> void on success, CardModelError on an inconsistent table
         */
        etl::expected<void, error::Error> populate(FileSystem& fileSystem) const;

    private:
        etl::string_view profileName;
        const FileRow* rows;
        size_t count;
    };

} // namespace simtrace
