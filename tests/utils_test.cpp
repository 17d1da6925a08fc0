#include "nbnsPacker.hpp"
#include <cassert>
#include <string>
#include <vector>

using namespace nbns;

int main() {
    std::string buf;
    put16bits(buf, 0x1234);
    put16bits(buf, 0xFF01);
    assert(buf.size() == 4);
    assert(static_cast<uchar>(buf[0]) == 0x12);
    assert(static_cast<uchar>(buf[1]) == 0x34);
    assert(static_cast<uchar>(buf[2]) == 0xFF);
    assert(static_cast<uchar>(buf[3]) == 0x01);

    const char* ptr = buf.data();
    assert(get16bits(ptr) == 0x1234);
    assert(get16bits(ptr) == 0xFF01);
    assert(ptr == buf.data() + 4);

    assert(stringToHex(std::string("\x00\x0A\xFF", 3)) == "000AFF");

    std::vector<std::string> labels = splitLabels("corp.example.com");
    assert(labels.size() == 3);
    assert(labels[1] == "example");
    assert(joinLabels(labels) == "corp.example.com");
    assert(splitLabels("").empty());
    assert(splitLabels("a..b").size() == 3);

    assert(str_toupper("FileSrv-01") == "FILESRV-01");
    return 0;
}
