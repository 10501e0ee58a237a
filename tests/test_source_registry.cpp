#include <iostream>
#include <fstream>
#include <filesystem>
#include <stdexcept>
#include <string>
#include "../src/LazyRangeBuffer.hpp"
#include "../src/RangeErrors.hpp"
#include "../src/SourceRegistry.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

int main() {
    try {
        auto tmpDir = std::filesystem::temp_directory_path() / "rangeop_registry_test";
        auto allowedDir = tmpDir / "allowed";
        auto deniedDir = tmpDir / "denied";
        std::filesystem::create_directories(allowedDir);
        std::filesystem::create_directories(deniedDir);
        auto allowedFile = allowedDir / "frames.bin";
        auto deniedFile = deniedDir / "secret.bin";
        {
            std::ofstream ofs(allowedFile, std::ios::binary);
            ofs << "frame0frame1frame2";
        }
        {
            std::ofstream ofs(deniedFile, std::ios::binary);
            ofs << "nope";
        }
        std::string handler = std::filesystem::canonical(allowedFile).string();

        SourceRegistry registry;
        auto source = registry.open(allowedFile.string());
        ASSERT_TRUE(source != nullptr);
        ASSERT_TRUE(source->path() == handler);
        ASSERT_TRUE(source->length() == 18);
        ASSERT_TRUE(registry.getByHandler(handler) == source);
        ASSERT_TRUE(registry.getByHandler("/no/such/handler") == nullptr);
        ASSERT_TRUE(registry.listHandlers().size() == 1);

        // Opening again shares the mapping and takes a reference
        auto again = registry.open(allowedFile.string());
        ASSERT_TRUE(again == source);
        ASSERT_TRUE(source->refCount() == 2);

        LazyRangeBuffer frame1(source.get(), 6, 6);
        auto data = frame1.data();
        ASSERT_TRUE(std::string(data.begin(), data.end()) == "frame1");

        ASSERT_TRUE(!registry.close(handler));
        ASSERT_TRUE(source->isReadable());
        ASSERT_TRUE(registry.close(handler));
        ASSERT_TRUE(!source->isReadable());
        ASSERT_TRUE(registry.getByHandler(handler) == nullptr);
        ASSERT_TRUE(registry.listHandlers().empty());
        ASSERT_TRUE(!registry.close(handler));

        // A buffer that outlived its source reports it instead of reading
        bool unavailable = false;
        try {
            frame1.data();
        } catch (const SourceUnavailable&) {
            unavailable = true;
        }
        ASSERT_TRUE(unavailable);

        // Allowed paths
        registry.setAllowedPaths({allowedDir.string(), (tmpDir / "missing").string()});
        ASSERT_TRUE(registry.isPathAllowed(allowedFile.string()));
        ASSERT_TRUE(!registry.isPathAllowed(deniedFile.string()));
        ASSERT_TRUE(!registry.isPathAllowed((allowedDir / "absent.bin").string()));
        bool denied = false;
        try {
            registry.open(deniedFile.string());
        } catch (const std::runtime_error& e) {
            denied = std::string(e.what()).find("Access denied") != std::string::npos;
        }
        ASSERT_TRUE(denied);
        ASSERT_TRUE(registry.open(allowedFile.string()) != nullptr);

        std::filesystem::remove_all(tmpDir);
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All source registry tests passed" << std::endl;
    return 0;
}
