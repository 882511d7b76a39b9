#pragma once

#include <mutex>
#include <random>
#include <string>

namespace worktrack {

class IRng {
public:
    virtual ~IRng() = default;
    
    virtual int uniformInt(int min, int max) = 0;
    
    /// Random RFC 4122 version 4 identifier
    std::string uuid() {
        static const char* kHex = "0123456789abcdef";
        std::string id(36, '-');
        for (std::size_t i = 0; i < id.size(); ++i) {
            if (i == 8 || i == 13 || i == 18 || i == 23) {
                continue;
            }
            int nibble = uniformInt(0, 15);
            if (i == 14) {
                nibble = 4;
            } else if (i == 19) {
                nibble = (nibble & 0x3) | 0x8;
            }
            id[i] = kHex[nibble];
        }
        return id;
    }
};

class StandardRng : public IRng {
private:
    std::random_device rd_;
    std::mt19937 gen_;
    std::mutex mutex_;
    
public:
    StandardRng() : gen_(rd_()) {}
    explicit StandardRng(unsigned int seed) : gen_(seed) {}
    
    int uniformInt(int min, int max) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::uniform_int_distribution<int> dist(min, max);
        return dist(gen_);
    }
};

} // namespace worktrack
