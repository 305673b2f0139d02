#include "utils.hpp"

#include <openssl/evp.h>
#include <spdlog/fmt/fmt.h>

#include <array>
#include <chrono>
#include <random>
#include <stdexcept>

std::string sha256_hex(std::string_view data){
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if(EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1){
        throw std::runtime_error("SHA-256 digest failed");
    }
    std::string out;
    out.reserve(length * 2);
    for(unsigned int i = 0; i < length; ++i){
        out += fmt::format("{:02x}", digest[i]);
    }
    return out;
}

std::string generate_id(const std::string& prefix){
    static thread_local std::mt19937_64 rng(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dist;
    return fmt::format("{}-{:016x}{:016x}", prefix, dist(rng), dist(rng));
}

int64_t now_millis(){
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}
