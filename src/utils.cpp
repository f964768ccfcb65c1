#include "utils.hpp"
#include <openssl/evp.h>
#include <array>
#include <fstream>
#include <iomanip>
#include <memory>
#include <sstream>

std::string hex_from_bytes(const std::vector<unsigned char>& b){
    std::ostringstream oss;
    for(auto c: b) oss << std::hex << std::setw(2) << std::setfill('0') << (int)c;
    return oss.str();
}

std::string sha256_file_hex(const std::filesystem::path& path, std::error_code& ec){
    ec.clear();
    std::ifstream in(path, std::ios::binary);
    if(!in){
        ec = std::make_error_code(std::errc::no_such_file_or_directory);
        return "";
    }
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if(!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1){
        ec = std::make_error_code(std::errc::not_enough_memory);
        return "";
    }
    std::array<char, 64 * 1024> buf;
    while(in){
        in.read(buf.data(), buf.size());
        auto n = in.gcount();
        if(n > 0 && EVP_DigestUpdate(ctx.get(), buf.data(), static_cast<size_t>(n)) != 1){
            ec = std::make_error_code(std::errc::io_error);
            return "";
        }
    }
    if(in.bad()){
        ec = std::make_error_code(std::errc::io_error);
        return "";
    }
    std::vector<unsigned char> digest(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if(EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1){
        ec = std::make_error_code(std::errc::io_error);
        return "";
    }
    digest.resize(len);
    return hex_from_bytes(digest);
}
