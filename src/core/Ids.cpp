#include "Ids.h"
#include "Discovery.h"
#include <openssl/rand.h>
#include <array>
#include <cstdint>
#include <stdexcept>

namespace rack_scan {

std::string generate_id(){
    std::array<unsigned char,16> b{};
    if(RAND_bytes(b.data(), static_cast<int>(b.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    auto ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now().time_since_epoch()).count());
    for(int i=0;i<6;i++) b[i] = static_cast<unsigned char>(ms >> (8*(5-i)));
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x70); // version 7
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80); // RFC 4122 variant
    static const char* hx = "0123456789abcdef";
    std::string out; out.reserve(36);
    for(size_t i=0;i<b.size();i++){
        if(i==4 || i==6 || i==8 || i==10) out.push_back('-');
        out.push_back(hx[b[i]>>4]); out.push_back(hx[b[i]&0xF]);
    }
    return out;
}

}
