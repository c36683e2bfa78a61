#include <gtest/gtest.h>
#include "SimTrace/Card/CardProfile.h"

using namespace simtrace;

TEST(CardProfileTests, PopulatesFullProfile)
{
    FileSystem fs;
    const CardProfile& profile = CardProfile::uiccSimUsimIsim();

    ASSERT_TRUE(profile.populate(fs).has_value());
    EXPECT_EQ(fs.size(), profile.size() + 1);

    EXPECT_TRUE(fs.findByPath("MF/EF_ICCID").has_value());
    EXPECT_TRUE(fs.findByPath("MF/DF_TELECOM/DF_PHONEBOOK/EF_PBR").has_value());
    EXPECT_TRUE(fs.findByPath("MF/DF_GSM/EF_IMSI").has_value());
    EXPECT_TRUE(fs.findByPath("MF/ADF_USIM/DF_5GS/EF_SUCI_CALC_INFO").has_value());
    EXPECT_TRUE(fs.findByPath("MF/ADF_ISIM/EF_IMPI").has_value());
}

TEST(CardProfileTests, ApplicationsCarryAid)
{
    FileSystem fs;
    ASSERT_TRUE(CardProfile::uiccSimUsimIsim().populate(fs).has_value());

    auto usim = fs.findByPath("MF/ADF_USIM");
    ASSERT_TRUE(usim.has_value());

    const FileNode& adf = fs.node(usim.value());
    EXPECT_EQ(adf.type, FileType::ApplicationDf);
    ASSERT_EQ(adf.aid.size(), 7U);
    EXPECT_EQ(adf.aid[5], 0x10);
    EXPECT_EQ(adf.aid[6], 0x02);
}

TEST(CardProfileTests, EmptyProfileKeepsRootOnly)
{
    FileSystem fs;
    ASSERT_TRUE(CardProfile::empty().populate(fs).has_value());
    EXPECT_EQ(fs.size(), 1U);
}

TEST(CardProfileTests, RejectsDepthJump)
{
    const FileRow broken[] = {
        {1, 0x7F10, "DF_TELECOM", FileType::DedicatedFile, 0, nullptr},
        {3, 0x4F30, "EF_PBR", FileType::LinearFixedEf, 0, nullptr},
    };
    const CardProfile profile("BROKEN", broken, 2);

    FileSystem fs;
    auto populated = profile.populate(fs);
    ASSERT_FALSE(populated.has_value());
    EXPECT_EQ(populated.error().get<error::CardModelError>(), error::CardModelError::InvalidPath);
}

TEST(CardProfileTests, RejectsApplicationWithoutAid)
{
    const FileRow broken[] = {
        {1, 0x7FF0, "ADF_USIM", FileType::ApplicationDf, 0, nullptr},
    };
    const CardProfile profile("NO-AID", broken, 1);

    FileSystem fs;
    EXPECT_FALSE(profile.populate(fs).has_value());
}
