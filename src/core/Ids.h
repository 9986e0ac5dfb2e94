#pragma once
#include <string>

namespace rack_scan {

// Time-ordered UUID (version 7 layout); random bits from the OpenSSL CSPRNG.
std::string generate_id();

}
