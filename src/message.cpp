#include <string>

#include "message.hpp"
#include "debugLog.hpp"

using namespace std;
using namespace nbns;


namespace
{

struct BodyCoder
{
    string operator()(const Request& request) const { return request.code(); }
};

struct BodyDescriber
{
    nlohmann::json operator()(const Request& request) const 
    { 
        nlohmann::json description;
        description["request"] = request.toJson();
        return description; 
    }
};

Message makeRequest(uint transactionId, uint nmFlags, const NbName& questionName, uint questionType)
{
    Header header;
    header.setID(transactionId);
    header.setR(Header::Request);
    header.setOpcode(Header::Query);
    header.setNmFlags(nmFlags);
    header.setRCode(Header::PositiveResponse);
    header.setQdCount(1);
    header.setAnCount(0);
    header.setNsCount(0);
    header.setArCount(0);

    return Message(header, Request(questionName, questionType, ClassIn));
}

}


Message::Message(const Header& header, const Body& body)
: m_header(header)
, m_body(body)
{
}


string Message::toBytes() const
{
    string buffer;
    m_header.code(buffer);
    buffer += std::visit(BodyCoder(), m_body);

    nbns::debug::logBuffer("Message::toBytes", "Message " + to_string(m_header.getID()), buffer);

    return buffer;
}


nlohmann::json Message::toJson() const
{
    nlohmann::json description = std::visit(BodyDescriber(), m_body);
    description["header"] = m_header.toJson();
    return description;
}


string Message::asString() const
{
    return toJson().dump();
}


Message nbns::makeNameQueryRequest(uint transactionId, const NbName& questionName, bool broadcast)
{
    uint nmFlags = Header::RecursionDesired;
    if (broadcast)
        nmFlags |= Header::Broadcast;

    return makeRequest(transactionId, nmFlags, questionName, TypeNb);
}


Message nbns::makeNodeStatusRequest(uint transactionId, const NbName& questionName, bool broadcast)
{
    uint nmFlags = 0;
    if (broadcast)
        nmFlags |= Header::Broadcast;

    return makeRequest(transactionId, nmFlags, questionName, TypeNbStat);
}
