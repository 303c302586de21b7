#include "utils.hpp"
#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

Sha256Stream::Sha256Stream(){
    if(SHA256_Init(&ctx_) != 1){
        throw std::runtime_error("SHA256_Init failed");
    }
}

void Sha256Stream::update(const char* data, std::size_t size){
    if(finished_){
        throw std::runtime_error("SHA-256 stream already finished");
    }
    if(size == 0) return;
    if(SHA256_Update(&ctx_, reinterpret_cast<const unsigned char*>(data), size) != 1){
        throw std::runtime_error("SHA256_Update failed");
    }
}

std::string Sha256Stream::finish_hex(){
    if(finished_){
        throw std::runtime_error("SHA-256 stream already finished");
    }
    std::vector<unsigned char> digest(SHA256_DIGEST_LENGTH);
    if(SHA256_Final(digest.data(), &ctx_) != 1){
        throw std::runtime_error("SHA256_Final failed");
    }
    finished_ = true;
    return hex_from_bytes(digest);
}

std::string to_lower(std::string value){
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
    return value;
}

std::string trim(std::string value){
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
        [](unsigned char ch){ return !std::isspace(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
        [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
    return value;
}

std::optional<uint64_t> parse_u64(const std::string& text, int base){
    if(text.empty()) return std::nullopt;
    bool digits = std::all_of(text.begin(), text.end(), [base](unsigned char ch){
        return base == 16 ? std::isxdigit(ch) != 0 : std::isdigit(ch) != 0;
    });
    if(!digits) return std::nullopt;
    errno = 0;
    char* end = nullptr;
    unsigned long long value = std::strtoull(text.c_str(), &end, base);
    if(errno == ERANGE || !end || *end != '\0') return std::nullopt;
    return static_cast<uint64_t>(value);
}

bool iequals(const std::string& a, const std::string& b){
    if(a.size() != b.size()) return false;
    for(std::size_t i = 0; i < a.size(); ++i){
        if(std::tolower(static_cast<unsigned char>(a[i])) !=
           std::tolower(static_cast<unsigned char>(b[i]))) return false;
    }
    return true;
}

bool is_hex_digest(const std::string& value){
    if(value.size() != SHA256_DIGEST_LENGTH * 2) return false;
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char ch){ return std::isxdigit(ch) != 0; });
}

std::string file_name_from_locator(const std::string& locator){
    std::string path = locator;
    auto cut = path.find_first_of("?#");
    if(cut != std::string::npos) path.erase(cut);
    auto scheme = path.find("://");
    if(scheme != std::string::npos){
        auto slash = path.find('/', scheme + 3);
        if(slash == std::string::npos) return std::string{};
        path.erase(0, slash);
    }
    auto last = path.find_last_of('/');
    return last == std::string::npos ? path : path.substr(last + 1);
}

std::string format_size(uint64_t bytes){
    if(bytes < 1024){
        return std::to_string(bytes) + "b";
    }

    static const char* suffixes[] = {"B", "K", "M", "G", "T", "P"};
    constexpr std::size_t suffix_count = sizeof(suffixes) / sizeof(suffixes[0]);
    double value = static_cast<double>(bytes);
    std::size_t idx = 0;
    while(idx + 1 < suffix_count && value >= 1024.0){
        value /= 1024.0;
        ++idx;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(value < 10.0 ? 2 : 1) << value;
    std::string out = oss.str();
    if(out.find('.') != std::string::npos){
        while(!out.empty() && out.back() == '0') out.pop_back();
        if(!out.empty() && out.back() == '.') out.pop_back();
    }
    return out + suffixes[idx];
}
