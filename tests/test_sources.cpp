#include <iostream>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include "../src/ChunkedSource.hpp"
#include "../src/LazyRangeBuffer.hpp"
#include "../src/MappedFileSource.hpp"
#include "../src/MemorySource.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

int main() {
    try {
        auto tmpDir = std::filesystem::temp_directory_path();
        auto tmpFile = tmpDir / "rangeop_sources_test.bin";
        auto emptyFile = tmpDir / "rangeop_sources_empty.bin";
        std::string content = "0123456789abcdefghijklmnopqrstuvwxyz";
        {
            std::ofstream ofs(tmpFile, std::ios::binary);
            ofs << content;
        }
        {
            std::ofstream ofs(emptyFile, std::ios::binary);
        }

        // Mapped file: positioned reads, offsets into the destination, end of file
        {
            MappedFileSource source(tmpFile.string());
            ASSERT_TRUE(source.isReadable());
            ASSERT_TRUE(source.length() == content.size());
            ASSERT_TRUE(source.refCount() == 1);

            std::vector<uint8_t> buf(8, 0xee);
            source.setPosition(10);
            ASSERT_TRUE(source.read(buf.data(), 2, 4) == 4);
            ASSERT_TRUE(buf[0] == 0xee && buf[1] == 0xee);
            ASSERT_TRUE(std::string(buf.begin() + 2, buf.begin() + 6) == "abcd");
            ASSERT_TRUE(source.position() == 14);

            source.setPosition(content.size() - 2);
            ASSERT_TRUE(source.read(buf.data(), 0, 8) == 2);
            ASSERT_TRUE(source.read(buf.data(), 0, 8) == 0);
            source.setPosition(1000);
            ASSERT_TRUE(source.read(buf.data(), 0, 8) == 0);

            LazyRangeBuffer range(&source, 26, 10);
            auto data = range.data();
            ASSERT_TRUE(std::string(data.begin(), data.end()) == "qrstuvwxyz");

            source.close();
            ASSERT_TRUE(!source.isReadable());
            bool threw = false;
            try {
                source.read(buf.data(), 0, 1);
            } catch (const std::runtime_error&) {
                threw = true;
            }
            ASSERT_TRUE(threw);
        }

        // Zero-length files can be opened and yield nothing
        {
            MappedFileSource source(emptyFile.string());
            ASSERT_TRUE(source.isReadable());
            ASSERT_TRUE(source.length() == 0);
            uint8_t b = 0;
            ASSERT_TRUE(source.read(&b, 0, 1) == 0);
        }

        // Chunked source: reads stop at the chunk boundary, then refill
        {
            MemorySource memory(std::vector<uint8_t>(content.begin(), content.end()));
            ChunkedSource chunked(memory, 10);
            std::vector<uint8_t> buf(36);
            ASSERT_TRUE(chunked.read(buf.data(), 0, 4) == 4);
            ASSERT_TRUE(chunked.read(buf.data(), 4, 36) == 6);
            ASSERT_TRUE(chunked.read(buf.data(), 10, 36) == 10);
            ASSERT_TRUE(std::string(buf.begin(), buf.begin() + 20) == content.substr(0, 20));

            // seeking discards the buffered chunk
            chunked.setPosition(30);
            ASSERT_TRUE(chunked.read(buf.data(), 0, 36) == 6);
            ASSERT_TRUE(chunked.read(buf.data(), 0, 36) == 0);
            ASSERT_TRUE(chunked.length() == content.size());

            chunked.close();
            ASSERT_TRUE(!memory.isReadable());
            ASSERT_TRUE(!chunked.isReadable());

            bool threw = false;
            try {
                ChunkedSource invalid(memory, 0);
            } catch (const std::invalid_argument&) {
                threw = true;
            }
            ASSERT_TRUE(threw);
        }

        std::filesystem::remove(tmpFile);
        std::filesystem::remove(emptyFile);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All source tests passed" << std::endl;
    return 0;
}
