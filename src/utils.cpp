#include "utils.hpp"

#include <openssl/evp.h>
#include <openssl/rand.h>

#include <unistd.h>

#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::vector<unsigned char> random_bytes(std::size_t count){
    std::vector<unsigned char> out(count);
    if(count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1){
        throw std::runtime_error("RAND_bytes failed");
    }
    return out;
}

std::string random_uuid(){
    auto bytes = random_bytes(16);
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3f) | 0x80);
    auto hex = hex_from_bytes(bytes);
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20, 12);
}

std::string base64_encode(const std::vector<unsigned char>& data){
    if(data.empty()) return {};
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    out.resize(written < 0 ? 0 : static_cast<std::size_t>(written));
    return out;
}

std::optional<std::vector<unsigned char>> base64_decode(const std::string& text){
    std::string clean;
    clean.reserve(text.size());
    for(char c : text){
        if(c == '\r' || c == '\n' || c == ' ' || c == '\t') continue;
        clean.push_back(c);
    }
    // data:image/png;base64,... prefixes are tolerated
    auto comma = clean.find(',');
    if(clean.rfind("data:", 0) == 0 && comma != std::string::npos){
        clean.erase(0, comma + 1);
    }
    if(clean.empty()) return std::vector<unsigned char>{};
    if(clean.size() % 4 != 0) return std::nullopt;

    std::vector<unsigned char> out(clean.size() / 4 * 3);
    int decoded = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(clean.data()),
                                  static_cast<int>(clean.size()));
    if(decoded < 0) return std::nullopt;
    // EVP_DecodeBlock keeps the padding bytes in its count
    std::size_t padding = 0;
    if(clean.back() == '=') ++padding;
    if(clean.size() > 1 && clean[clean.size() - 2] == '=') ++padding;
    out.resize(static_cast<std::size_t>(decoded) - padding);
    return out;
}

std::string format_size(uint64_t bytes){
    std::ostringstream oss;
    if(bytes < 1024){
        oss << bytes << " B";
    } else if(bytes < 1024ull * 1024){
        oss << std::fixed << std::setprecision(1) << bytes / 1024.0 << " KB";
    } else if(bytes < 1024ull * 1024 * 1024){
        oss << std::fixed << std::setprecision(1) << bytes / (1024.0 * 1024.0) << " MB";
    } else {
        oss << std::fixed << std::setprecision(2) << bytes / (1024.0 * 1024.0 * 1024.0) << " GB";
    }
    return oss.str();
}

std::string local_hostname(){
    char hostname[256] = {0};
    if(gethostname(hostname, sizeof(hostname) - 1) != 0 || hostname[0] == '\0'){
        return "UnknownHost";
    }
    return hostname;
}

std::string to_portable_path(const std::filesystem::path& relative){
    std::string out;
    for(const auto& part : relative){
        auto piece = part.string();
        if(piece.empty() || piece == ".") continue;
        if(!out.empty()) out.push_back('/');
        out += piece;
    }
    return out;
}

bool is_safe_component(const std::string& name){
    if(name.empty() || name == "." || name == "..") return false;
    for(char c : name){
        if(c == '/' || c == '\\' || c == '\0') return false;
    }
    return true;
}

std::optional<std::filesystem::path> resolve_under(const std::filesystem::path& root,
                                                   const std::string& relative){
    if(relative.empty()) return std::nullopt;
    if(relative.front() == '/' || relative.front() == '\\') return std::nullopt;
    std::filesystem::path result = root;
    std::size_t start = 0;
    while(start <= relative.size()){
        auto end = relative.find_first_of("/\\", start);
        if(end == std::string::npos) end = relative.size();
        auto piece = relative.substr(start, end - start);
        if(!piece.empty() && piece != "."){
            if(!is_safe_component(piece)) return std::nullopt;
            if(piece.size() >= 2 && piece[1] == ':') return std::nullopt;
            result /= piece;
        }
        start = end + 1;
    }
    if(result == root) return std::nullopt;
    return result;
}

std::filesystem::path unique_destination(const std::filesystem::path& desired){
    std::error_code ec;
    if(!std::filesystem::exists(desired, ec)) return desired;
    auto parent = desired.parent_path();
    auto stem = desired.stem().string();
    auto ext = desired.extension().string();
    for(int n = 1;; ++n){
        auto candidate = parent / (stem + " (" + std::to_string(n) + ")" + ext);
        if(!std::filesystem::exists(candidate, ec)) return candidate;
    }
}
