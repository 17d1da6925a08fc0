#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "nbnsPacker.hpp"
#include "errors.hpp"


namespace nbns 
{

/*
 * NetBIOS name, RFC 1001 section 14.1 and RFC 1002 section 4.1.
 *
 * On the wire a name is 15 bytes of text plus a purpose byte, first-level
 * encoded into 32 letters in 'A'..'P', followed by the scope as DNS labels:
 *
 *   0x20 | 32 x 'A'..'P' | (len | label)* | 0x00
 */
class NbName 
{
public:

    enum Purpose { Workstation=0x00, Messenger=0x03, DomainMaster=0x1B, FileServer=0x20 };

    static constexpr std::size_t VALUE_LEN = 15;
    static constexpr std::size_t FULL_LEN = 16;
    static constexpr std::size_t ENCODED_LEN = 32;
    static constexpr std::size_t MAX_LABEL_LEN = 63;
    static constexpr std::size_t MAX_NAME_LEN = 255;

    static constexpr char WILDCARD = '*';

    // Throws NameTooLongError or InvalidScopeError.
    NbName(const std::string& value, const std::string& scope = "", uchar purpose = Workstation);

    std::string toBytes() const;

    // Throws MalformedNameError.
    static NbName fromBytes(const std::string& data);

    // FILESRV<20>.CORP.EXAMPLE
    std::string asString() const;
    nlohmann::json toJson() const;

    const std::string& getValue() const { return m_value; }
    const std::string& getScope() const { return m_scope; }
    uchar getPurpose() const { return m_purpose; }

    bool isWildcard() const { return m_value.size() == 1 && m_value[0] == WILDCARD; }

    bool operator==(const NbName& other) const;
    bool operator!=(const NbName& other) const { return !(*this == other); }

private:
    std::string m_value;
    std::string m_scope;
    uchar m_purpose;

    std::string padded() const;

    static void encode_byte(std::string& buffer, uchar value);
    static uchar decode_word(char hi, char lo);
};

}
