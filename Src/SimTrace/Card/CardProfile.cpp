/**
 * @file CardProfile.cpp
 * @author Nathan Houwaart (n.m.houwaart@hva.nl)
 * @brief Card profile tables
 * @version 0.1
 * @date 2026-03-03
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "SimTrace/Card/CardProfile.h"
#include "Utils/Hex.h"
#include "Utils/Logging.h"

using namespace simtrace;
using namespace simtrace::buffer;

namespace
{
    constexpr FileType DF = FileType::DedicatedFile;
    constexpr FileType ADF = FileType::ApplicationDf;
    constexpr FileType TR = FileType::TransparentEf;
    constexpr FileType LF = FileType::LinearFixedEf;
    constexpr FileType CY = FileType::CyclicEf;

    // ETSI TS 102 221, 3GPP TS 51.011, TS 31.102 and TS 31.103
    constexpr FileRow UICC_SIM_USIM_ISIM[] = {
        // MF level
        {1, 0x2F00, "EF_DIR",        LF,  0x1E, nullptr},
        {1, 0x2FE2, "EF_ICCID",      TR,  0x02, nullptr},
        {1, 0x2F05, "EF_PL",         TR,  0x05, nullptr},
        {1, 0x2F06, "EF_ARR",        LF,  0x06, nullptr},
        {1, 0x2F08, "EF_UMPC",       TR,  0x08, nullptr},

        // DF.TELECOM
        {1, 0x7F10, "DF_TELECOM",    DF,  0,    nullptr},
        {2, 0x6F06, "EF_ARR",        LF,  0,    nullptr},
        {2, 0x6F3A, "EF_ADN",        LF,  0,    nullptr},
        {2, 0x6F3B, "EF_FDN",        LF,  0,    nullptr},
        {2, 0x6F3C, "EF_SMS",        LF,  0,    nullptr},
        {2, 0x6F40, "EF_MSISDN",     LF,  0,    nullptr},
        {2, 0x6F42, "EF_SMSP",       LF,  0,    nullptr},
        {2, 0x6F43, "EF_SMSS",       TR,  0,    nullptr},
        {2, 0x6F44, "EF_LND",        CY,  0,    nullptr},
        {2, 0x6F49, "EF_SDN",        LF,  0,    nullptr},
        {2, 0x6F4A, "EF_EXT1",       LF,  0,    nullptr},
        {2, 0x6F4B, "EF_EXT2",       LF,  0,    nullptr},
        {2, 0x5F50, "DF_GRAPHICS",   DF,  0,    nullptr},
        {3, 0x4F20, "EF_IMG",        LF,  0,    nullptr},
        {2, 0x5F3A, "DF_PHONEBOOK",  DF,  0,    nullptr},
        {3, 0x4F30, "EF_PBR",        LF,  0,    nullptr},
        {3, 0x4F22, "EF_PSC",        TR,  0,    nullptr},
        {3, 0x4F23, "EF_CC",         TR,  0,    nullptr},
        {3, 0x4F24, "EF_PUID",       TR,  0,    nullptr},

        // DF.GSM (SIM application)
        {1, 0x7F20, "DF_GSM",        DF,  0,    nullptr},
        {2, 0x6F05, "EF_LP",         TR,  0,    nullptr},
        {2, 0x6F07, "EF_IMSI",       TR,  0,    nullptr},
        {2, 0x6F20, "EF_KC",         TR,  0,    nullptr},
        {2, 0x6F30, "EF_PLMNSEL",    TR,  0,    nullptr},
        {2, 0x6F31, "EF_HPPLMN",     TR,  0,    nullptr},
        {2, 0x6F37, "EF_ACMMAX",     TR,  0,    nullptr},
        {2, 0x6F38, "EF_SST",        TR,  0,    nullptr},
        {2, 0x6F39, "EF_ACM",        CY,  0,    nullptr},
        {2, 0x6F41, "EF_PUCT",       TR,  0,    nullptr},
        {2, 0x6F45, "EF_CBMI",       TR,  0,    nullptr},
        {2, 0x6F46, "EF_SPN",        TR,  0,    nullptr},
        {2, 0x6F74, "EF_BCCH",       TR,  0,    nullptr},
        {2, 0x6F78, "EF_ACC",        TR,  0,    nullptr},
        {2, 0x6F7B, "EF_FPLMN",      TR,  0,    nullptr},
        {2, 0x6F7E, "EF_LOCI",       TR,  0,    nullptr},
        {2, 0x6FAD, "EF_AD",         TR,  0,    nullptr},
        {2, 0x6FAE, "EF_PHASE",      TR,  0,    nullptr},

        // ADF.USIM
        {1, 0x7FF0, "ADF_USIM",      ADF, 0,    "A0000000871002"},
        {2, 0x6FB7, "EF_ECC",        LF,  0x01, nullptr},
        {2, 0x6F05, "EF_LI",         TR,  0x02, nullptr},
        {2, 0x6FAD, "EF_AD",         TR,  0x03, nullptr},
        {2, 0x6F38, "EF_UST",        TR,  0x04, nullptr},
        {2, 0x6F56, "EF_EST",        TR,  0x05, nullptr},
        {2, 0x6F78, "EF_ACC",        TR,  0x06, nullptr},
        {2, 0x6F07, "EF_IMSI",       TR,  0x07, nullptr},
        {2, 0x6F08, "EF_KEYS",       TR,  0x08, nullptr},
        {2, 0x6F09, "EF_KEYSPS",     TR,  0x09, nullptr},
        {2, 0x6F60, "EF_PLMNWACT",   TR,  0x0A, nullptr},
        {2, 0x6F7E, "EF_LOCI",       TR,  0x0B, nullptr},
        {2, 0x6F73, "EF_PSLOCI",     TR,  0x0C, nullptr},
        {2, 0x6F7B, "EF_FPLMN",      TR,  0x0D, nullptr},
        {2, 0x6F31, "EF_HPPLMN",     TR,  0x12, nullptr},
        {2, 0x6F62, "EF_HPLMNWACT",  TR,  0x13, nullptr},
        {2, 0x6FE3, "EF_EPSLOCI",    TR,  0x1E, nullptr},
        {2, 0x6F06, "EF_ARR",        LF,  0x17, nullptr},
        {2, 0x6F46, "EF_SPN",        TR,  0,    nullptr},
        {2, 0x6F3C, "EF_SMS",        LF,  0,    nullptr},
        {2, 0x6F42, "EF_SMSP",       LF,  0,    nullptr},
        {2, 0x6F40, "EF_MSISDN",     LF,  0,    nullptr},
        {2, 0x6F39, "EF_ACM",        CY,  0,    nullptr},
        {2, 0x6F37, "EF_ACMMAX",     TR,  0,    nullptr},
        {2, 0x6F43, "EF_SMSS",       TR,  0,    nullptr},
        {2, 0x5F3A, "DF_PHONEBOOK",  DF,  0,    nullptr},
        {3, 0x4F30, "EF_PBR",        LF,  0,    nullptr},
        {2, 0x5F3B, "DF_GSM_ACCESS", DF,  0,    nullptr},
        {3, 0x4F20, "EF_KC",         TR,  0x01, nullptr},
        {3, 0x4F52, "EF_KCGPRS",     TR,  0x02, nullptr},
        {2, 0x5FC0, "DF_5GS",        DF,  0,    nullptr},
        {3, 0x4F01, "EF_5GS3GPPLOCI", TR, 0x01, nullptr},
        {3, 0x4F03, "EF_5GS3GPPNSC", LF,  0x03, nullptr},
        {3, 0x4F07, "EF_SUCI_CALC_INFO", TR, 0x07, nullptr},
        {3, 0x4F08, "EF_OPL5G",      LF,  0x08, nullptr},
        {3, 0x4F09, "EF_SUPI_NAI",   TR,  0x09, nullptr},
        {3, 0x4F0A, "EF_ROUTING_INDICATOR", TR, 0x0A, nullptr},

        // ADF.ISIM
        {1, 0x7FF1, "ADF_ISIM",      ADF, 0,    "A0000000871004"},
        {2, 0x6F02, "EF_IMPI",       TR,  0x02, nullptr},
        {2, 0x6FAD, "EF_AD",         TR,  0x03, nullptr},
        {2, 0x6F04, "EF_IMPU",       LF,  0x04, nullptr},
        {2, 0x6F03, "EF_DOMAIN",     TR,  0x05, nullptr},
        {2, 0x6F06, "EF_ARR",        LF,  0x06, nullptr},
        {2, 0x6F07, "EF_IST",        TR,  0x07, nullptr},
        {2, 0x6F09, "EF_PCSCF",      LF,  0x09, nullptr},
        {2, 0x6F3C, "EF_SMS",        LF,  0,    nullptr},
        {2, 0x6F42, "EF_SMSP",       LF,  0,    nullptr},
    };
}

CardProfile::CardProfile(etl::string_view name, const FileRow* rows, size_t count)
    : profileName(name)
    , rows(rows)
    , count(count)
{
}

const CardProfile& CardProfile::uiccSimUsimIsim()
{
    static const CardProfile profile(
        "UICC-SIM-USIM-ISIM",
        UICC_SIM_USIM_ISIM,
        sizeof(UICC_SIM_USIM_ISIM) / sizeof(UICC_SIM_USIM_ISIM[0]));
    return profile;
}

const CardProfile& CardProfile::empty()
{
    static const CardProfile profile("MF-ONLY", nullptr, 0);
    return profile;
}

etl::expected<void, error::Error> CardProfile::populate(FileSystem& fileSystem) const
{
    // Last node seen per depth; depth 0 is the MF
    NodeId parents[PATH_DEPTH_MAX];
    parents[0] = fileSystem.root();
    uint8_t deepest = 0;

    for (size_t i = 0; i < count; ++i)
    {
        const FileRow& row = rows[i];

        if (row.depth == 0 || row.depth >= PATH_DEPTH_MAX || row.depth > deepest + 1)
        {
            LOG_ERROR("Profile %.*s: row %zu (%s) has invalid depth %u",
                      static_cast<int>(profileName.size()), profileName.data(), i, row.name, static_cast<unsigned>(row.depth));
            return etl::unexpected(error::Error::fromCardModel(error::CardModelError::InvalidPath));
        }

        etl::expected<NodeId, error::Error> added = etl::unexpected(
            error::Error::fromCardModel(error::CardModelError::InvalidPath));

        if (row.type == FileType::ApplicationDf)
        {
            etl::vector<uint8_t, AID_MAX> aid;
            if (row.depth != 1 || row.aidHex == nullptr || !utils::parseHex(row.aidHex, aid))
            {
                LOG_ERROR("Profile row %zu (%s): invalid application definition", i, row.name);
                return etl::unexpected(error::Error::fromCardModel(error::CardModelError::InvalidPath));
            }
            added = fileSystem.addApplication(row.fid, row.name, aid);
        }
        else
        {
            added = fileSystem.addFile(parents[row.depth - 1], row.fid, row.name, row.type, row.sfi);
        }

        if (!added.has_value())
        {
            LOG_ERROR("Profile row %zu (%s): %s", i, row.name, added.error().toString().c_str());
            return etl::unexpected(added.error());
        }

        parents[row.depth] = added.value();
        deepest = row.depth;
    }

    return {};
}
