#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "nbnsPacker.hpp"


namespace nbns 
{

// NBNS header, RFC 1002 section 4.2.1.1:
//
//   NAME_TRN_ID | R OPCODE NM_FLAGS RCODE | QDCOUNT | ANCOUNT | NSCOUNT | ARCOUNT
//
// six big-endian 16 bits words, the second one packed MSB first as
// R(1) OPCODE(4) NM_FLAGS(7) RCODE(4).
class Header 
{
public:

    enum Type { Request=0, Response=1 };

    enum Opcode { Query=0x0, Registration=0x5, Release=0x6, Wack=0x7, Refresh=0x8, AltRefresh=0x9, MultiHomed=0xF };

    enum NmFlag 
    { 
        Broadcast           = 1 << 0, 
        RecursionAvailable  = 1 << 3, 
        RecursionDesired    = 1 << 4, 
        Truncation          = 1 << 5, 
        AuthoritativeAnswer = 1 << 6 
    };

    enum RCode { PositiveResponse=0x0, FormatError=0x1, ServerFailure=0x2, Unsupported=0x4, Refused=0x5, Active=0x6, Conflict=0x7 };

    static constexpr uint HDR_SIZE = 12;

    Header();

    // Appends the 12 header bytes. Fields wider than their slot are masked.
    void code(std::string& buffer) const;

    // Throws MalformedHeaderError when size is below HDR_SIZE.
    void decode(const char* buffer, int size);

    uint getFlags() const;

    nlohmann::json toJson() const;

    uint getID() const { return m_id; }
    uint getR() const { return m_r; }
    uint getOpcode() const { return m_opcode; }
    uint getNmFlags() const { return m_nmFlags; }
    uint getRCode() const { return m_rcode; }
    uint getQdCount() const { return m_qdCount; }
    uint getAnCount() const { return m_anCount; }
    uint getNsCount() const { return m_nsCount; }
    uint getArCount() const { return m_arCount; }

    void setID(uint id) { m_id = id; }
    void setR(uint r) { m_r = r; }
    void setOpcode(uint opcode) { m_opcode = opcode; }
    void setNmFlags(uint nmFlags) { m_nmFlags = nmFlags; }
    void setRCode(uint rcode) { m_rcode = rcode; }
    void setQdCount(uint count) { m_qdCount = count; }
    void setAnCount(uint count) { m_anCount = count; }
    void setNsCount(uint count) { m_nsCount = count; }
    void setArCount(uint count) { m_arCount = count; }

    bool operator==(const Header& other) const;
    bool operator!=(const Header& other) const { return !(*this == other); }

private:
    uint m_id;
    uint m_r;           // 0=request; 1=response
    uint m_opcode;
    uint m_nmFlags;
    uint m_rcode;

    uint m_qdCount;
    uint m_anCount;
    uint m_nsCount;
    uint m_arCount;

    static constexpr uint R_MASK = 0x1;
    static constexpr uint OPCODE_MASK = 0xF;
    static constexpr uint NM_FLAGS_MASK = 0x7F;
    static constexpr uint RCODE_MASK = 0xF;
    static constexpr uint WORD_MASK = 0xFFFF;

    static constexpr uint R_SHIFT = 15;
    static constexpr uint OPCODE_SHIFT = 11;
    static constexpr uint NM_FLAGS_SHIFT = 4;
};

}
