#include "test_base.hpp"
#include "core/file_descriptor.hpp"

class FileDescriptorTest : public TestBase
{
};

TEST_F(FileDescriptorTest, ExtensionAndCategory)
{
    FileDescriptor file("Photo.Final.JPEG", "Image/JPEG", 10);
    EXPECT_EQ(file.extension(), ".jpeg");
    EXPECT_EQ(file.category(), "image");

    EXPECT_EQ(FileDescriptor("README", "", 0).extension(), "");
    EXPECT_EQ(FileDescriptor("trailing.", "", 0).extension(), "");
    EXPECT_EQ(FileDescriptor("x", "bogus", 0).category(), "");
}

TEST_F(FileDescriptorTest, GuessMimeType)
{
    EXPECT_EQ(FileDescriptor::guessMimeType("a.png"), "image/png");
    EXPECT_EQ(FileDescriptor::guessMimeType("A.JPG"), "image/jpeg");
    EXPECT_EQ(FileDescriptor::guessMimeType("notes.txt"), "text/plain");
    EXPECT_EQ(FileDescriptor::guessMimeType("mystery.xyz"), "application/octet-stream");
    EXPECT_EQ(FileDescriptor::guessMimeType("noext"), "application/octet-stream");
}

TEST_F(FileDescriptorTest, FromPathSharesContent)
{
    std::string path = writeFile("data.txt", ByteBuffer{'h', 'e', 'l', 'l', 'o'});
    FileDescriptor file = FileDescriptor::fromPath(path);

    EXPECT_EQ(file.name(), "data.txt");
    EXPECT_EQ(file.type(), "text/plain");
    EXPECT_EQ(file.size(), 5u);
    ASSERT_TRUE(file.hasContent());

    FileDescriptor copy = file;
    EXPECT_EQ(copy.content().get(), file.content().get());
    EXPECT_EQ(copy, file);
}

TEST_F(FileDescriptorTest, FromPathRejectsMissingFiles)
{
    EXPECT_THROW(FileDescriptor::fromPath((test_files_dir_ / "absent.bin").string()), std::runtime_error);
    EXPECT_THROW(FileDescriptor::fromPath(test_files_dir_.string()), std::runtime_error);
}

TEST_F(FileDescriptorTest, IdentityIncludesContentBuffer)
{
    FileDescriptor a = FileDescriptor::fromBytes("a.bin", "x/y", ByteBuffer(3, 1));
    FileDescriptor b = FileDescriptor::fromBytes("a.bin", "x/y", ByteBuffer(3, 1));
    EXPECT_NE(a, b);
    EXPECT_EQ(a.size(), 3u);
}
