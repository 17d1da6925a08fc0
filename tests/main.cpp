#include <iostream>
#include <string>
#include <cstdlib>

#include "message.hpp"
#include "nbnsPacker.hpp"


using namespace std;
using namespace nbns;


int main(int argc, char** argv) 
{
    if (argc < 2)
    {
        std::cout << "Usage ./NbnsQuery NAME [scope] [purpose-hex] [--broadcast]" << std::endl;
        return -1;
    }

    std::string value = argv[1];
    std::string scope;
    uint purpose = NbName::Workstation;
    bool broadcast = false;

    int positional = 0;
    for (int i = 2; i < argc; ++i)
    {
        std::string arg = argv[i];
        if (arg == "--broadcast")
            broadcast = true;
        else if (positional == 0)
        {
            scope = arg;
            positional++;
        }
        else if (positional == 1)
        {
            purpose = static_cast<uint>(std::strtoul(arg.c_str(), NULL, 16)) & 0xFF;
            positional++;
        }
        else
        {
            std::cout << "Unexpected argument " << arg << std::endl;
            return -1;
        }
    }

    try
    {
        NbName name(value, scope, static_cast<uchar>(purpose));
        Message query = makeNameQueryRequest(0x0001, name, broadcast);

        std::cout << query.toJson().dump(4) << std::endl;
        std::cout << stringToHex(query.toBytes()) << std::endl;
    }
    catch (const NameError& e)
    {
        std::cout << "Invalid name: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
