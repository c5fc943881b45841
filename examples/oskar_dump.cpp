/**
 * @file oskar_dump.cpp
 * @brief Prints the header and every record of an OSKAR binary file
 *
 * Usage: oskar_dump [--lenient] <file>
 *
 * With --lenient, checksum mismatches are reported as warnings and the
 * dump continues.
 */

#include <oskar/file_header.hh>
#include <oskar/layout.hh>
#include <oskar/record_iterator.hh>
#include <oskar/type_descriptor.hh>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

int main(int argc, char* argv[]) {
    bool lenient = false;
    std::string path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--lenient") {
            lenient = true;
        } else if (path.empty()) {
            path = arg;
        } else {
            path.clear();
            break;
        }
    }

    if (path.empty()) {
        std::cout << "Usage: " << argv[0] << " [--lenient] <file>\n";
        std::cout << "\n";
        std::cout << "Lists the header and all records of an OSKAR binary file.\n";
        return 1;
    }

    oskar::scan_options options;
    options.strict = !lenient;
    options.on_warning = [](std::uint64_t offset,
                            std::string_view category,
                            std::string_view message) {
        std::cerr << "Warning at offset " << offset
                  << " [" << category << "]: " << message << "\n";
    };

    try {
        auto it = oskar::record_iterator::open(path, options);
        const auto& header = it->header();

        // Header fields straight from the file, one per line
        std::ifstream raw(path, std::ios::binary);
        std::vector<std::byte> bytes;
        std::istreambuf_iterator<char> in(raw), eof;
        for (; in != eof && bytes.size() < oskar::header_size; ++in) {
            bytes.push_back(static_cast<std::byte>(*in));
        }

        std::cout << "File: " << path << "\n";
        oskar::print_layout(std::cout, oskar::decode_layout(oskar::header_layout(), bytes.data(), bytes.size()));
        std::cout << "  (app version " << header.app_version_string()
                  << (header.expects_crc() ? ", checksummed" : ", no checksums") << ")\n\n";

        while (it->has_next()) {
            const auto& rec = it->current();
            const auto& t = rec.tag;

            std::cout << "Record " << it->records_read() << " @" << rec.file_offset << ": ";
            if (t.is_extended()) {
                std::cout << "group '" << rec.group_name << "', tag '" << rec.tag_name << "'";
            } else {
                std::cout << "group " << static_cast<unsigned>(t.group_id)
                          << ", tag " << static_cast<unsigned>(t.tag_id);
            }
            std::cout << ", index " << t.user_index << "\n";

            std::cout << "  " << oskar::type_descriptor::from_tag(t).describe()
                      << (t.is_payload_big_endian() ? ", big-endian" : "")
                      << (t.uses_crc32c() ? (rec.checksum_ok ? ", crc ok" : ", CRC MISMATCH") : "")
                      << ", " << t.payload_size << " bytes, "
                      << oskar::value_count(rec.value) << " values\n";

            std::cout << "  ";
            oskar::print_value(std::cout, rec.value);
            std::cout << "\n";

            it->next();
        }

        std::cout << "\n" << it->records_read() << " records\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
