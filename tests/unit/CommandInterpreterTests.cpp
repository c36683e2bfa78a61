#include <gtest/gtest.h>
#include "Support/CommandTestSupport.h"

using namespace simtrace;

class CommandInterpreterTest : public testsupport::CommandTest {
};

// ============================================================================
// STATUS
// ============================================================================

TEST_F(CommandInterpreterTest, StatusReportsCurrentDfWithoutChange) {
    run("00A4080404 7F106F3A 9000");
    auto command = run("80F2000000 9000");

    EXPECT_EQ(command->kind(), CommandKind::Status);
    EXPECT_STREQ(command->pathString().c_str(), "MF/DF_TELECOM");
    EXPECT_STREQ(command->colId().c_str(), "7F10");
    EXPECT_STREQ(command->processed().c_str(), "current DF DF_TELECOM, no application");
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/DF_TELECOM/EF_ADN"));
}

TEST_F(CommandInterpreterTest, StatusShowsApplication) {
    run("00A4040407A0000000871002 9000");
    auto command = run("80F2010C00 9000");

    EXPECT_STREQ(command->processed().c_str(), "application initialized; current DF ADF_USIM, application ADF_USIM");
}

// ============================================================================
// READ / UPDATE BINARY
// ============================================================================

TEST_F(CommandInterpreterTest, ReadBinaryBySfiSelectsEf) {
    run("00A4040407A0000000871002 9000");
    auto command = run("00B0870009 083910101032547698 9000");

    EXPECT_STREQ(command->pathString().c_str(), "MF/ADF_USIM/EF_IMSI");
    EXPECT_STREQ(command->colId().c_str(), "6F07");
    EXPECT_STREQ(command->processed().c_str(), "offset 0, 9 bytes; data=083910101032547698");
    EXPECT_EQ(state.currentNode(0), nodeAt("MF/ADF_USIM/EF_IMSI"));
}

TEST_F(CommandInterpreterTest, ReadBinaryWithoutEf) {
    auto command = run("00B0000002 0102 9000");

    EXPECT_NE(command->processed().find("no EF selected"), etl::istring::npos);
}

TEST_F(CommandInterpreterTest, UpdateBinaryWithoutDataIsDegraded) {
    run("00A4080404 7F206F07 9000");
    auto command = run("00D6000000 9000");

    EXPECT_TRUE(command->isDegraded());
    EXPECT_STREQ(command->processed().c_str(), "malformed UPDATE BINARY command (Decode Error: MissingData)");
}

// ============================================================================
// READ / UPDATE RECORD
// ============================================================================

TEST_F(CommandInterpreterTest, RecordPointerMovesInNextAndPreviousMode) {
    run("00A4080404 7F106F3A 9000");

    auto first = run("00B2000204 01020304 9000");
    EXPECT_STREQ(first->colId().c_str(), "6F3A#1");
    EXPECT_EQ(state.recordPointer(0), 1);

    auto second = run("00B2000204 05060708 9000");
    EXPECT_STREQ(second->colId().c_str(), "6F3A#2");
    EXPECT_STREQ(second->processed().c_str(), "record 2 (next); data=05060708");

    auto previous = run("00B2000304 01020304 9000");
    EXPECT_STREQ(previous->colId().c_str(), "6F3A#1");
    EXPECT_EQ(state.recordPointer(0), 1);
}

TEST_F(CommandInterpreterTest, AbsoluteRecordKeepsPointer) {
    run("00A4080404 7F106F3A 9000");
    run("00B2000204 01020304 9000");

    auto command = run("00B2050404 01020304 9000");
    EXPECT_STREQ(command->colId().c_str(), "6F3A#5");
    EXPECT_EQ(state.recordPointer(0), 1);
}

TEST_F(CommandInterpreterTest, FailedRecordReadKeepsPointer) {
    run("00A4080404 7F106F3A 9000");
    run("00B2000204 01020304 9000");

    auto command = run("00B2000204 6A83");
    EXPECT_EQ(state.recordPointer(0), 1);
    EXPECT_NE(command->processed().find("record not found"), etl::istring::npos);
}

TEST_F(CommandInterpreterTest, ReadRecordBySfi) {
    run("00A4040407A0000000871002 9000");
    auto command = run("00B2010C03 112233 9000");

    EXPECT_STREQ(command->pathString().c_str(), "MF/ADF_USIM/EF_ECC");
    EXPECT_STREQ(command->colId().c_str(), "6FB7#1");
}

// ============================================================================
// PIN handling
// ============================================================================

TEST_F(CommandInterpreterTest, VerifyPinSuccess) {
    auto command = run("0020000108 31323334FFFFFFFF 9000");

    EXPECT_STREQ(command->colId().c_str(), "PIN1");
    EXPECT_STREQ(command->processed().c_str(), "pin=1234; PIN1 verified");
    EXPECT_TRUE(state.isPinVerified(0, 0x01));
}

TEST_F(CommandInterpreterTest, VerifyPinFailureReportsRetries) {
    run("0020000108 31323334FFFFFFFF 9000");
    auto command = run("0020000108 39393939FFFFFFFF 63C2");

    EXPECT_FALSE(state.isPinVerified(0, 0x01));
    EXPECT_STREQ(command->processed().c_str(),
                 "pin=9999; PIN1 not verified, 2 retries left; verification failed, 2 retries left");
}

TEST_F(CommandInterpreterTest, VerifyQueryDoesNotClear) {
    run("0020000108 31323334FFFFFFFF 9000");
    auto command = run("0020000100 63C3");

    EXPECT_TRUE(state.isPinVerified(0, 0x01));
    EXPECT_NE(command->processed().find("3 retries left"), etl::istring::npos);
}

TEST_F(CommandInterpreterTest, SimVerifyChv) {
    auto command = run("A020000108 31323334FFFFFFFF 9000");

    EXPECT_STREQ(command->name().data(), "VERIFY CHV");
    EXPECT_STREQ(command->colId().c_str(), "CHV1");
}

TEST_F(CommandInterpreterTest, ChangePinWrongLengthIsDegraded) {
    auto command = run("0024000108 31323334FFFFFFFF 9000");

    EXPECT_TRUE(command->isDegraded());
    EXPECT_FALSE(state.isPinVerified(0, 0x01));
}

// ============================================================================
// MANAGE CHANNEL
// ============================================================================

TEST_F(CommandInterpreterTest, ManageChannelOpenAssignedByCard) {
    auto command = run("0070000001 01 9000");

    EXPECT_STREQ(command->colId().c_str(), "CH 1");
    EXPECT_STREQ(command->processed().c_str(), "channel 1 opened");
    EXPECT_TRUE(state.isOpen(1));
    EXPECT_EQ(state.currentNode(1), state.fileSystem().root());
}

TEST_F(CommandInterpreterTest, ManageChannelKeepsCursorsApart) {
    run("0070000001 01 9000");
    run("01A40004027F10 9000");

    EXPECT_EQ(state.currentNode(1), nodeAt("MF/DF_TELECOM"));
    EXPECT_EQ(state.currentNode(0), state.fileSystem().root());

    auto close = run("0070800100 9000");
    EXPECT_STREQ(close->processed().c_str(), "channel 1 closed");
    EXPECT_FALSE(state.isOpen(1));
}

TEST_F(CommandInterpreterTest, ManageChannelCloseUnopened) {
    auto command = run("0070800300 9000");

    EXPECT_NE(command->processed().find("close channel 3 failed (CardModel Error: ChannelNotOpen)"), etl::istring::npos);
}

// ============================================================================
// File life cycle
// ============================================================================

TEST_F(CommandInterpreterTest, DeactivateAndActivateCurrentFile) {
    run("00A4080404 7F206F07 9000");
    const NodeId imsi = nodeAt("MF/DF_GSM/EF_IMSI");

    auto deactivate = run("0004000000 9000");
    EXPECT_STREQ(deactivate->processed().c_str(), "EF_IMSI deactivated");
    EXPECT_EQ(state.fileSystem().node(imsi).lifeCycle, LifeCycle::Deactivated);

    auto rehabilitate = run("A044000000 9000");
    EXPECT_STREQ(rehabilitate->processed().c_str(), "EF_IMSI rehabilitated");
    EXPECT_EQ(state.fileSystem().node(imsi).lifeCycle, LifeCycle::Activated);
}
