/**
 * @file stream_dump.cpp
 * @brief Hex dump of one document stored in a compound file image
 *
 * The block chain is given on the command line, so this works on any
 * image whose allocation table has been inspected by other means.
 *
 * Usage: stream_dump <image> <block_size> <document_size> <block>[,<block>...]
 */

#include <cfb/document.hh>
#include <cfb/document_stream.hh>
#include <cfb/exceptions.hh>
#include <iostream>
#include <fstream>
#include <vector>
#include <string>
#include <sstream>
#include <iomanip>
#include <iterator>
#include <algorithm>

static std::vector<std::uint32_t> parse_chain(const std::string& text) {
    std::vector<std::uint32_t> chain;
    std::istringstream iss(text);
    std::string item;
    while (std::getline(iss, item, ',')) {
        chain.push_back(static_cast<std::uint32_t>(std::stoul(item)));
    }
    return chain;
}

static void dump(cfb::document_stream& stream) {
    std::vector<std::byte> line(16);
    std::uint64_t offset = 0;
    std::int64_t n;
    while ((n = stream.read(line.data(), line.size(), 0, static_cast<std::int64_t>(line.size()))) != cfb::document_stream::eof) {
        std::cout << std::hex << std::setw(8) << std::setfill('0') << offset << "  ";
        for (std::int64_t i = 0; i < n; i++) {
            std::cout << std::setw(2) << std::to_integer<int>(line[static_cast<std::size_t>(i)]) << ' ';
        }
        std::cout << std::dec << "\n";
        offset += static_cast<std::uint64_t>(n);
    }
}

int main(int argc, char* argv[]) {
    if (argc != 5) {
        std::cerr << "Usage: " << argv[0] << " <image> <block_size> <document_size> <block>[,<block>...]\n";
        return 1;
    }

    std::ifstream file(argv[1], std::ios::binary);
    if (!file) {
        std::cerr << "Failed to open file: " << argv[1] << "\n";
        return 1;
    }
    std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    std::vector<std::byte> image(raw.size());
    std::transform(raw.begin(), raw.end(), image.begin(), [](char c) { return static_cast<std::byte>(c); });

    try {
        const std::size_t block_size = std::stoul(argv[2]);
        const std::uint64_t size = std::stoull(argv[3]);

        cfb::stream_options options;
        options.strict = false;
        options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
            std::cerr << "warning [" << category << "] at " << offset << ": " << message << "\n";
        };

        // Regular compound files keep their header in the first block
        cfb::block_storage storage(image.data(), image.size(), block_size, block_size);
        cfb::document doc(storage, parse_chain(argv[4]), size, options);
        cfb::document_stream stream(doc);
        dump(stream);
    } catch (const cfb::cfb_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::logic_error& e) {
        std::cerr << "Invalid argument: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
