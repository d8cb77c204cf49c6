#include "geoinsight/semantic_cache/fingerprint.h"

#include <cctype>
#include <initializer_list>
#include <iomanip>
#include <sstream>

#include <openssl/sha.h>

namespace geoinsight {
namespace semantic_cache {

std::string NormalizeRequestText(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (unsigned char c : text) {
        if (std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out.push_back(' ');
            pending_space = false;
        }
        out.push_back(static_cast<char>(c));
    }
    return out;
}

std::string Sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0')
           << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string RequestFingerprint(const std::string& text,
                               const std::string& parser_identity,
                               const std::string& schema_version) {
    // Length prefixes keep ("ab", "c") and ("a", "bc") apart.
    std::ostringstream material;
    for (const std::string& part : {NormalizeRequestText(text), parser_identity, schema_version}) {
        material << part.size() << ':' << part << ';';
    }
    return Sha256Hex(material.str());
}

} // namespace semantic_cache
} // namespace geoinsight
