#include "infrastructure/IdGenerator.hpp"
#include <mutex>
#include <random>

namespace findoc::infrastructure {

std::string IdGenerator::NewUuid() {
    static std::mutex mutex;
    static std::mt19937_64 engine{std::random_device{}()};

    unsigned char bytes[16];
    {
        std::lock_guard<std::mutex> lock(mutex);
        std::uniform_int_distribution<int> dist(0, 255);
        for (auto& b : bytes) {
            b = static_cast<unsigned char>(dist(engine));
        }
    }
    bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40); // version 4
    bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80); // variant 10

    static const char hex[] = "0123456789abcdef";
    std::string s;
    s.reserve(36);
    for (int i = 0; i < 16; ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) s.push_back('-');
        s.push_back(hex[bytes[i] >> 4]);
        s.push_back(hex[bytes[i] & 0x0F]);
    }
    return s;
}

} // namespace findoc::infrastructure
