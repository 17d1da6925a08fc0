#pragma once

#include <string>
#include <variant>

#include <nlohmann/json.hpp>

#include "header.hpp"
#include "query.hpp"


namespace nbns 
{

// Responses are not built by this library, a request is the only body kind.
typedef std::variant<Request> Body;

class Message 
{
public:

    Message(const Header& header, const Body& body);

    // Header bytes followed by the body selected from the variant.
    std::string toBytes() const;

    nlohmann::json toJson() const;
    std::string asString() const;

    const Header& getHeader() const { return m_header; }
    const Body& getBody() const { return m_body; }

private:
    Header m_header;
    Body m_body;
};

// NAME QUERY REQUEST, RFC 1002 section 4.2.12.
Message makeNameQueryRequest(uint transactionId, const NbName& questionName, bool broadcast = false);

// NODE STATUS REQUEST, RFC 1002 section 4.2.17.
Message makeNodeStatusRequest(uint transactionId, const NbName& questionName, bool broadcast = false);

}
