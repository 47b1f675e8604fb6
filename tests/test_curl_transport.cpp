#include <gtest/gtest.h>
#include "../transport/curl_transport.hpp"

// ============================================================================
// Partial-upload cleanup commands
// ============================================================================

TEST(CurlTransport, FtpCleanupUsesBareNameAfterCwd) {
    // A relative working directory must not be prefixed again: the connection
    // is already inside it when the command runs
    auto cmd = CurlTransport::remove_command(TransferProtocol::FTP, "pmps", ".plc-01.json.part");
    EXPECT_EQ(cmd.command, "*DELE .plc-01.json.part");
    EXPECT_TRUE(cmd.after_cwd);
}

TEST(CurlTransport, SftpCleanupUsesQuotedFullPath) {
    auto cmd = CurlTransport::remove_command(TransferProtocol::SFTP, "/Hard Disk/ftp/pmps",
                                             ".plc-01.json.part");
    EXPECT_EQ(cmd.command, "*rm \"/Hard Disk/ftp/pmps/.plc-01.json.part\"");
    EXPECT_FALSE(cmd.after_cwd);

    auto root = CurlTransport::remove_command(TransferProtocol::SFTP, "/", "a\"b");
    EXPECT_EQ(root.command, "*rm \"/a\\\"b\"");
}
