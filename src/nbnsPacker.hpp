#pragma once

#include <cctype>
#include <algorithm>
#include <string>
#include <vector>


namespace nbns 
{

typedef unsigned char uchar;
typedef unsigned int uint;

// Big-endian 16 bits helpers, the only integer width used by NBNS requests.
void put16bits(std::string& buffer, uint value);
uint get16bits(const char*& buffer);

std::string stringToHex(const std::string& input);

// "A.B.C" -> {"A", "B", "C"}, "" -> {}. Empty labels are kept so that callers can reject them.
std::vector<std::string> splitLabels(const std::string& dotted);
std::string joinLabels(const std::vector<std::string>& labels);

inline std::string str_toupper(std::string s)
{
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return std::toupper(c); } );
    return s;
}

}
