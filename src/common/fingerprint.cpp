#include "common/fingerprint.hpp"
#include <fmt/core.h>
#include <boost/uuid/detail/md5.hpp>

namespace runbox {
using namespace std;

string fingerprint(const string &code) {
    boost::uuids::detail::md5 hash;
    boost::uuids::detail::md5::digest_type digest;
    hash.process_bytes(code.data(), code.size());
    hash.get_digest(digest);

    // get_digest 按 MD5 规定的字节序写入摘要，因此直接按字节读取
    const auto *bytes = reinterpret_cast<const unsigned char *>(&digest[0]);
    return fmt::format("{:02x}{:02x}{:02x}{:02x}", bytes[0], bytes[1], bytes[2], bytes[3]);
}

}  // namespace runbox
