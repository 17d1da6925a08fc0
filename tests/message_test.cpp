#include <cassert>
#include <string>
#include <variant>

#include "message.hpp"
#include "nbnsPacker.hpp"

using namespace nbns;


int main() {
    // Broadcast name query for FILESRV<20>
    {
        NbName fileServer("FILESRV", "", NbName::FileServer);
        Message query = makeNameQueryRequest(0xABCD, fileServer, true);

        std::string bytes = query.toBytes();
        assert(bytes.size() == 12 + 34 + 4);

        assert(stringToHex(bytes.substr(0, 12)) == "ABCD01100001000000000000");
        assert(bytes.substr(12, 34) == fileServer.toBytes());
        assert(bytes.substr(12, 34) == buildQuestionEntry(fileServer, TypeNb, ClassIn).substr(0, 34));
        assert(stringToHex(bytes.substr(46)) == "00200001");

        assert(stringToHex(bytes) ==
               "ABCD01100001000000000000"
               "20" "4547454A454D4546464446434647434143414341434143414341434143414341" "00"
               "00200001");

        const Header& header = query.getHeader();
        assert(header.getR() == Header::Request);
        assert(header.getOpcode() == Header::Query);
        assert(header.getNmFlags() == (Header::RecursionDesired | Header::Broadcast));
        assert(header.getRCode() == Header::PositiveResponse);
        assert(header.getQdCount() == 1);
        assert(header.getAnCount() == 0);
        assert(header.getNsCount() == 0);
        assert(header.getArCount() == 0);

        const Request& request = std::get<Request>(query.getBody());
        assert(request.getQuestionName() == fileServer);
        assert(request.getQuestionType() == TypeNb);
        assert(request.getQuestionClass() == ClassIn);
    }

    // Unicast name query only asks for recursion
    {
        Message query = makeNameQueryRequest(0x0042, NbName("workgroup", "corp", NbName::DomainMaster));
        std::string bytes = query.toBytes();
        assert(stringToHex(bytes.substr(0, 12)) == "004201000001000000000000");
        assert(NbName::fromBytes(bytes.substr(12, bytes.size() - 12 - 4)) ==
               NbName("WORKGROUP", "CORP", NbName::DomainMaster));
    }

    // Node status request for the wildcard name
    {
        Message status = makeNodeStatusRequest(0x0001, NbName("*"));
        std::string bytes = status.toBytes();
        assert(stringToHex(bytes.substr(0, 12)) == "000100000001000000000000");
        assert(stringToHex(bytes.substr(bytes.size() - 4)) == "00210001");

        Message broadcastStatus = makeNodeStatusRequest(0x0002, NbName("*"), true);
        assert(broadcastStatus.getHeader().getNmFlags() == Header::Broadcast);
    }

    // Question entry on its own
    {
        std::string entry = buildQuestionEntry(NbName("HOST", "lan"), TypeNbStat, ClassIn);
        assert(entry.size() == 34 + 4 + 4);
        assert(stringToHex(entry.substr(entry.size() - 9)) == "034C414E0000210001");
    }

    // JSON description
    {
        Message query = makeNameQueryRequest(0xABCD, NbName("FILESRV", "", NbName::FileServer), true);
        nlohmann::json description = query.toJson();
        assert(description["header"]["name_trn_id"] == 0xABCD);
        assert(description["header"]["nm_flags"] == 0x11);
        assert(description["request"]["question_type"] == 0x20);
        assert(description["request"]["question_class"] == 1);
        assert(description["request"]["question_name"]["name"] == "FILESRV<20>");
        assert(!query.asString().empty());
    }

    return 0;
}
