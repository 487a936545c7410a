#include "cli/dump.hpp"

#include "common.hpp"
#include "log/log.hpp"
#include "msgpack/message_unpacker.hpp"

#include <fstream>
#include <iterator>
#include <vector>

namespace msgcodec::cli {

auto dump_file(const std::string& path, std::ostream& out) -> int {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        MSGCODEC_LOG_ERROR("msgdump", "cannot open " << path);
        return 1;
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(in)),
                               std::istreambuf_iterator<char>());
    if (in.bad()) {
        MSGCODEC_LOG_ERROR("msgdump", "failed to read " << path);
        return 1;
    }
    MSGCODEC_LOG_DEBUG("msgdump", "read " << bytes.size() << " bytes from " << path);

    msgpack::MessageUnpacker unpacker(bytes);
    size_t count = 0;
    while (unpacker.has_next()) {
        auto value = unpacker.unpack_value();
        if (is_err(value)) {
            MSGCODEC_LOG_ERROR("msgdump", path << ": " << unwrap_err(value).to_string());
            return 1;
        }
        out << unwrap(value).to_string() << "\n";
        ++count;
    }
    MSGCODEC_LOG_INFO("msgdump", "decoded " << count << " values");
    return 0;
}

} // namespace msgcodec::cli
