#pragma once

#include <string>

namespace webhunter {

class CryptoUtils {
public:
    // Lowercase hex SHA-256 digest
    static std::string sha256(const std::string& data);
};

} // namespace webhunter
