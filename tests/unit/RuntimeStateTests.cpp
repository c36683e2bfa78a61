#include <gtest/gtest.h>
#include "SimTrace/Card/CardProfile.h"
#include "SimTrace/Card/RuntimeState.h"
#include "Utils/Hex.h"

using namespace simtrace;
using error::CardModelError;

class RuntimeStateTest : public ::testing::Test {
protected:
    void SetUp() override {
        FileSystem fs;
        ASSERT_TRUE(CardProfile::uiccSimUsimIsim().populate(fs).has_value());
        state = RuntimeState(fs);
    }

    NodeId nodeAt(const char* path) const {
        auto node = state.fileSystem().findByPath(path);
        EXPECT_TRUE(node.has_value()) << path;
        return node.has_value() ? node.value() : INVALID_NODE;
    }

    etl::vector<uint8_t, buffer::AID_MAX> aid(const char* hex) const {
        etl::vector<uint8_t, buffer::AID_MAX> bytes;
        EXPECT_TRUE(utils::parseHex(hex, bytes));
        return bytes;
    }

    RuntimeState state;
};

TEST_F(RuntimeStateTest, StartsAtMfWithBasicChannelOpen) {
    EXPECT_EQ(state.currentNode(0), state.fileSystem().root());
    EXPECT_TRUE(state.isOpen(0));
    EXPECT_FALSE(state.isOpen(1));
    EXPECT_FALSE(state.applicationContext(0).has_value());
}

TEST_F(RuntimeStateTest, SelectChildMovesCursor) {
    auto selected = state.selectChild(0, 0x7F10);
    ASSERT_TRUE(selected.has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_TELECOM"));

    etl::string<buffer::PATH_STRING_MAX> path;
    state.pathString(state.currentNode(0), path);
    EXPECT_STREQ(path.c_str(), "MF/DF_TELECOM");
}

TEST_F(RuntimeStateTest, MissingChildLeavesCursorUnchanged) {
    ASSERT_TRUE(state.selectChild(0, 0x7F10).has_value());
    const NodeId before = state.currentNode(0);

    auto selected = state.selectChild(0, 0x6F99);
    ASSERT_FALSE(selected.has_value());
    EXPECT_EQ(selected.error().get<CardModelError>(), CardModelError::FileNotFound);
    EXPECT_EQ(state.currentNode(0), before);
}

TEST_F(RuntimeStateTest, SelectByFileIdReachesParentAndSiblingDf) {
    ASSERT_TRUE(state.selectByFileId(0, 0x7F10).has_value());
    ASSERT_TRUE(state.selectByFileId(0, 0x5F50).has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_TELECOM/DF_GRAPHICS"));

    // Parent by its own FID
    ASSERT_TRUE(state.selectByFileId(0, 0x7F10).has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_TELECOM"));

    // Sibling DF of DF_TELECOM
    ASSERT_TRUE(state.selectByFileId(0, 0x7F20).has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_GSM"));
}

TEST_F(RuntimeStateTest, SelectByFileIdDoesNotReachSiblingEf) {
    ASSERT_TRUE(state.selectByFileId(0, 0x7F10).has_value());

    // EF_IMSI lives in DF_GSM, a sibling of the current DF
    auto selected = state.selectByFileId(0, 0x6F07);
    ASSERT_FALSE(selected.has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_TELECOM"));
}

TEST_F(RuntimeStateTest, SelectByFileIdFromEfUsesItsDf) {
    ASSERT_TRUE(state.selectByFileId(0, 0x7F20).has_value());
    ASSERT_TRUE(state.selectByFileId(0, 0x6F07).has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_GSM/EF_IMSI"));
    EXPECT_EQ(state.currentDf(0), nodeAt("MF/DF_GSM"));

    // Sibling EF in the same DF
    ASSERT_TRUE(state.selectByFileId(0, 0x6F38).has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_GSM/EF_SST"));
}

TEST_F(RuntimeStateTest, SelectParent) {
    ASSERT_TRUE(state.selectAbsolute(0, etl::vector<uint16_t, 4>{0x7F10, 0x5F3A}).has_value());
    ASSERT_TRUE(state.selectParent(0).has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_TELECOM"));

    ASSERT_TRUE(state.selectParent(0).has_value());
    auto atRoot = state.selectParent(0);
    ASSERT_FALSE(atRoot.has_value());
    EXPECT_EQ(atRoot.error().get<CardModelError>(), CardModelError::NoParent);
}

TEST_F(RuntimeStateTest, SelectAbsoluteWithAndWithoutMf) {
    ASSERT_TRUE(state.selectAbsolute(0, etl::vector<uint16_t, 4>{0x3F00, 0x7F10, 0x6F3A}).has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_TELECOM/EF_ADN"));

    ASSERT_TRUE(state.selectAbsolute(0, etl::vector<uint16_t, 4>{0x7F20, 0x6F07}).has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_GSM/EF_IMSI"));
}

TEST_F(RuntimeStateTest, SelectAbsoluteThroughEfFails) {
    auto selected = state.selectAbsolute(0, etl::vector<uint16_t, 4>{0x2FE2, 0x6F07});
    ASSERT_FALSE(selected.has_value());
    EXPECT_EQ(selected.error().get<CardModelError>(), CardModelError::NotADirectory);
    EXPECT_EQ(state.currentNode(0), state.fileSystem().root());
}

TEST_F(RuntimeStateTest, CurrentAdfRequiresApplication) {
    auto selected = state.selectAbsolute(0, etl::vector<uint16_t, 4>{0x7FFF, 0x6F07});
    ASSERT_FALSE(selected.has_value());
    EXPECT_EQ(selected.error().get<CardModelError>(), CardModelError::NoApplicationSelected);

    ASSERT_TRUE(state.selectApplication(0, aid("A0000000871002")).has_value());
    ASSERT_TRUE(state.selectByFileId(0, FID_MF).has_value());
    ASSERT_TRUE(state.selectAbsolute(0, etl::vector<uint16_t, 4>{0x7FFF, 0x6F07}).has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/ADF_USIM/EF_IMSI"));
}

TEST_F(RuntimeStateTest, SelectRelative) {
    ASSERT_TRUE(state.selectByFileId(0, 0x7F10).has_value());
    ASSERT_TRUE(state.selectRelative(0, etl::vector<uint16_t, 4>{0x5F3A, 0x4F30}).has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_TELECOM/DF_PHONEBOOK/EF_PBR"));

    auto empty = state.selectRelative(0, etl::vector<uint16_t, 4>());
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().get<CardModelError>(), CardModelError::InvalidPath);
}

TEST_F(RuntimeStateTest, SelectApplicationSetsContext) {
    ASSERT_TRUE(state.selectApplication(0, aid("A0000000871004")).has_value());

    auto context = state.applicationContext(0);
    ASSERT_TRUE(context.has_value());
    EXPECT_STREQ(context->name.c_str(), "ADF_ISIM");
    EXPECT_EQ(context->adf, nodeAt("MF/ADF_ISIM"));

    auto unknown = state.selectApplication(0, aid("A000000063"));
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error().get<CardModelError>(), CardModelError::ApplicationNotFound);
}

TEST_F(RuntimeStateTest, SelectBySfi) {
    ASSERT_TRUE(state.selectApplication(0, aid("A0000000871002")).has_value());
    ASSERT_TRUE(state.selectBySfi(0, 0x07).has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/ADF_USIM/EF_IMSI"));

    // Current DF of an EF is its parent
    ASSERT_TRUE(state.selectBySfi(0, 0x04).has_value());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/ADF_USIM/EF_UST"));
}

TEST_F(RuntimeStateTest, ResetReturnsEveryChannelToMf) {
    ASSERT_TRUE(state.openChannel(2, 0).has_value());
    ASSERT_TRUE(state.selectApplication(0, aid("A0000000871002")).has_value());
    ASSERT_TRUE(state.selectByFileId(2, 0x7F10).has_value());
    state.markPinVerified(0, 0x01);

    state.reset();

    EXPECT_EQ(state.currentNode(0), state.fileSystem().root());
    EXPECT_EQ(state.currentNode(2), state.fileSystem().root());
    EXPECT_FALSE(state.isOpen(2));
    EXPECT_FALSE(state.applicationContext(0).has_value());
    EXPECT_FALSE(state.isPinVerified(0, 0x01));

    // Relative lookups resolve as if nothing was selected
    EXPECT_FALSE(state.selectChild(0, 0x5F50).has_value());
    EXPECT_TRUE(state.selectChild(0, 0x7F10).has_value());
}

TEST_F(RuntimeStateTest, ResetSingleChannelKeepsOthers) {
    ASSERT_TRUE(state.openChannel(1, 0).has_value());
    ASSERT_TRUE(state.selectByFileId(0, 0x7F10).has_value());
    ASSERT_TRUE(state.selectByFileId(1, 0x7F20).has_value());

    state.reset(1);

    EXPECT_TRUE(state.isOpen(1));
    EXPECT_EQ(state.currentNode(1), state.fileSystem().root());
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_TELECOM"));
}

TEST_F(RuntimeStateTest, ChannelsAreIndependent) {
    ASSERT_TRUE(state.openChannel(1, 0).has_value());
    ASSERT_TRUE(state.selectByFileId(1, 0x7F20).has_value());

    EXPECT_EQ(state.currentNode(0), state.fileSystem().root());
    EXPECT_EQ(state.currentNode(1), nodeAt("MF/DF_GSM"));
}

TEST_F(RuntimeStateTest, OpenChannelFromNonBasicChannelCopiesSelection) {
    ASSERT_TRUE(state.openChannel(1, 0).has_value());
    ASSERT_TRUE(state.selectApplication(1, aid("A0000000871002")).has_value());

    ASSERT_TRUE(state.openChannel(2, 1).has_value());
    EXPECT_EQ(state.currentNode(2), nodeAt("MF/ADF_USIM"));
    ASSERT_TRUE(state.applicationContext(2).has_value());

    ASSERT_TRUE(state.openChannel(3, 0).has_value());
    EXPECT_EQ(state.currentNode(3), state.fileSystem().root());
}

TEST_F(RuntimeStateTest, ChannelErrors) {
    auto basic = state.closeChannel(0);
    ASSERT_FALSE(basic.has_value());
    EXPECT_EQ(basic.error().get<CardModelError>(), CardModelError::InvalidChannel);

    auto closed = state.closeChannel(5);
    ASSERT_FALSE(closed.has_value());
    EXPECT_EQ(closed.error().get<CardModelError>(), CardModelError::ChannelNotOpen);

    auto outOfRange = state.openChannel(20, 0);
    ASSERT_FALSE(outOfRange.has_value());
    EXPECT_EQ(outOfRange.error().get<CardModelError>(), CardModelError::InvalidChannel);

    auto notOpen = state.selectChild(4, 0x7F10);
    ASSERT_FALSE(notOpen.has_value());
    EXPECT_EQ(notOpen.error().get<CardModelError>(), CardModelError::ChannelNotOpen);
}

TEST_F(RuntimeStateTest, PinScopes) {
    ASSERT_TRUE(state.openChannel(1, 0).has_value());
    ASSERT_TRUE(state.selectApplication(0, aid("A0000000871002")).has_value());

    state.markPinVerified(0, 0x01);
    state.markPinVerified(0, 0x81);

    // Card wide PIN is visible everywhere, application PIN only on its channel
    EXPECT_TRUE(state.isPinVerified(1, 0x01));
    EXPECT_TRUE(state.isPinVerified(0, 0x81));
    EXPECT_FALSE(state.isPinVerified(1, 0x81));

    // Another application drops the local verification
    ASSERT_TRUE(state.selectApplication(0, aid("A0000000871004")).has_value());
    EXPECT_FALSE(state.isPinVerified(0, 0x81));
    EXPECT_TRUE(state.isPinVerified(0, 0x01));

    state.clearPinVerified(0, 0x01);
    EXPECT_FALSE(state.isPinVerified(1, 0x01));
}

TEST_F(RuntimeStateTest, RecordPointerFollowsFile) {
    ASSERT_TRUE(state.selectAbsolute(0, etl::vector<uint16_t, 4>{0x7F10, 0x6F3A}).has_value());
    state.setRecordPointer(0, 3);
    EXPECT_EQ(state.recordPointer(0), 3);

    // Same file again keeps the pointer
    ASSERT_TRUE(state.selectByFileId(0, 0x6F3A).has_value());
    EXPECT_EQ(state.recordPointer(0), 3);

    ASSERT_TRUE(state.selectByFileId(0, 0x6F3B).has_value());
    EXPECT_EQ(state.recordPointer(0), 0);
}
