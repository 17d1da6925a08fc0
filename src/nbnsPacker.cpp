#include <string>
#include <iomanip>
#include <sstream>

#include "nbnsPacker.hpp"

namespace nbns
{


void put16bits(std::string& buffer, uint value)
{
    buffer.push_back(static_cast<char>((value & 0xFF00) >> 8));
    buffer.push_back(static_cast<char>(value & 0xFF));
}


uint get16bits(const char*& buffer)
{
    uint value = static_cast<uchar> (buffer[0]);
    value = value << 8;
    value += static_cast<uchar> (buffer[1]);
    buffer += 2;

    return value;
}


std::string stringToHex(const std::string& input) 
{
    std::stringstream ss;
    ss << std::hex << std::uppercase << std::setfill('0');
    for (char c : input) 
    {
        ss << std::setw(2) << static_cast<int>(static_cast<uchar>(c));
    }
    return ss.str();
}


std::vector<std::string> splitLabels(const std::string& dotted)
{
    std::vector<std::string> labels;
    if (dotted.empty())
        return labels;

    std::string::size_type start = 0, end;
    while ((end = dotted.find('.', start)) != std::string::npos) 
    {
        labels.push_back(dotted.substr(start, end - start));
        start = end + 1; // Skip '.'
    }
    labels.push_back(dotted.substr(start));

    return labels;
}


std::string joinLabels(const std::vector<std::string>& labels)
{
    std::string result;
    for (std::size_t i = 0; i < labels.size(); ++i) 
    {
        if (i != 0)
            result.push_back('.');
        result.append(labels[i]);
    }
    return result;
}


}
