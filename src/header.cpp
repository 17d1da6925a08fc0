#include <sstream>

#include "header.hpp"
#include "errors.hpp"
#include "debugLog.hpp"

using namespace nbns;
using namespace std;


namespace
{

uint masked(const char* field, uint value, uint mask)
{
    if ((value & ~mask) != 0)
    {
        ostringstream text;
        text << field << " " << showbase << hex << value 
             << " does not fit in mask " << mask << ", sent as " << (value & mask);
        nbns::debug::log("Header::code", text.str());
    }
    return value & mask;
}

}


Header::Header() 
{
    m_id=0;
    m_r=Request;
    m_opcode=Query;
    m_nmFlags=0;
    m_rcode=PositiveResponse;

    m_qdCount=0;
    m_anCount=0;
    m_nsCount=0;
    m_arCount=0;
}


bool Header::operator==(const Header& other) const
{
    return m_id == other.m_id 
        && m_r == other.m_r 
        && m_opcode == other.m_opcode 
        && m_nmFlags == other.m_nmFlags 
        && m_rcode == other.m_rcode 
        && m_qdCount == other.m_qdCount 
        && m_anCount == other.m_anCount 
        && m_nsCount == other.m_nsCount 
        && m_arCount == other.m_arCount;
}


uint Header::getFlags() const
{
    uint flags = 0;
    flags |= masked("rcode", m_rcode, RCODE_MASK);
    flags |= masked("nm_flags", m_nmFlags, NM_FLAGS_MASK) << NM_FLAGS_SHIFT;
    flags |= masked("opcode", m_opcode, OPCODE_MASK) << OPCODE_SHIFT;
    flags |= masked("r", m_r, R_MASK) << R_SHIFT;

    return flags;
}


void Header::code(std::string& buffer) const  
{
    put16bits(buffer, masked("name_trn_id", m_id, WORD_MASK));
    put16bits(buffer, getFlags());

    put16bits(buffer, masked("qdcount", m_qdCount, WORD_MASK));
    put16bits(buffer, masked("ancount", m_anCount, WORD_MASK));
    put16bits(buffer, masked("nscount", m_nsCount, WORD_MASK));
    put16bits(buffer, masked("arcount", m_arCount, WORD_MASK));
}


void Header::decode(const char* buffer, int size)  
{
    if (size < static_cast<int>(HDR_SIZE))
    {
        throw MalformedHeaderError("NBNS header needs " + to_string(HDR_SIZE) + 
                                   " bytes, got " + to_string(size));
    }

    m_id = get16bits(buffer);

    uint flags = get16bits(buffer);
    m_rcode = flags & RCODE_MASK;
    m_nmFlags = (flags >> NM_FLAGS_SHIFT) & NM_FLAGS_MASK;
    m_opcode = (flags >> OPCODE_SHIFT) & OPCODE_MASK;
    m_r = (flags >> R_SHIFT) & R_MASK;

    m_qdCount = get16bits(buffer);
    m_anCount = get16bits(buffer);
    m_nsCount = get16bits(buffer);
    m_arCount = get16bits(buffer);
}


nlohmann::json Header::toJson() const
{
    nlohmann::json description;
    description["name_trn_id"] = m_id;
    description["r"] = m_r;
    description["opcode"] = m_opcode;
    description["nm_flags"] = m_nmFlags;
    description["rcode"] = m_rcode;
    description["flags"] = getFlags();
    description["qdcount"] = m_qdCount;
    description["ancount"] = m_anCount;
    description["nscount"] = m_nsCount;
    description["arcount"] = m_arCount;
    return description;
}
