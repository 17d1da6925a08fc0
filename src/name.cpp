#include <cstddef>
#include <vector>
#include <sstream>
#include <iomanip>

#include "name.hpp"
#include "debugLog.hpp"

using namespace std;
using namespace nbns;


NbName::NbName(const std::string& value, const std::string& scope, uchar purpose)
: m_purpose(purpose)
{
    if (value.size() > VALUE_LEN)
    {
        throw NameTooLongError("NetBIOS name '" + value + "' is too long: " +
                               to_string(value.size()) + " bytes, at most " +
                               to_string(VALUE_LEN) + " allowed");
    }

    m_value = str_toupper(value);
    m_scope = str_toupper(scope);

    // length byte + encoded name + root terminator
    size_t encodedSize = 1 + ENCODED_LEN + 1;
    for (const string& label : splitLabels(m_scope))
    {
        if (label.empty())
            throw InvalidScopeError("NetBIOS scope '" + m_scope + "' has an empty label");

        if (label.size() > MAX_LABEL_LEN)
        {
            throw InvalidScopeError("NetBIOS scope label '" + label + "' is too long: " +
                                    to_string(label.size()) + " bytes, at most " +
                                    to_string(MAX_LABEL_LEN) + " allowed");
        }
        encodedSize += 1 + label.size();
    }

    if (encodedSize > MAX_NAME_LEN)
    {
        throw InvalidScopeError("NetBIOS scope '" + m_scope + "' makes the encoded name " +
                                to_string(encodedSize) + " bytes long, at most " +
                                to_string(MAX_NAME_LEN) + " allowed");
    }
}


bool NbName::operator==(const NbName& other) const
{
    return m_value == other.m_value 
        && m_scope == other.m_scope 
        && m_purpose == other.m_purpose;
}


string NbName::asString() const
{
    ostringstream text;
    text << m_value << '<' << hex << setfill('0') << setw(2) << static_cast<uint>(m_purpose) << '>';
    if (!m_scope.empty())
        text << '.' << m_scope;

    return text.str();
}


nlohmann::json NbName::toJson() const
{
    nlohmann::json description;
    description["name"] = asString();
    description["value"] = m_value;
    description["scope"] = m_scope;
    description["purpose"] = static_cast<uint>(m_purpose);
    return description;
}


string NbName::padded() const
{
    string result;
    result.reserve(FULL_LEN);

    if (isWildcard())
    {
        result.push_back(WILDCARD);
        result.append(VALUE_LEN - 1, '\0');
    }
    else
    {
        result = m_value;
        result.append(VALUE_LEN - m_value.size(), ' ');
    }

    result.push_back(static_cast<char>(m_purpose));
    return result;
}


string NbName::toBytes() const
{
    string buffer;
    buffer.reserve(MAX_NAME_LEN);

    buffer.push_back(static_cast<char>(ENCODED_LEN));
    for (char c : padded())
        encode_byte(buffer, static_cast<uchar>(c));

    for (const string& label : splitLabels(m_scope))
    {
        buffer.push_back(static_cast<char>(label.size())); // label length octet
        buffer.append(label);
    }

    buffer.push_back(0); // root label

    nbns::debug::logBuffer("NbName::toBytes", "Encoded " + asString(), buffer);

    return buffer;
}


NbName NbName::fromBytes(const std::string& data)
{
    if (data.empty())
        throw MalformedNameError("NetBIOS name is empty");

    if (data.size() > MAX_NAME_LEN)
    {
        throw MalformedNameError("NetBIOS name is " + to_string(data.size()) +
                                 " bytes long, at most " + to_string(MAX_NAME_LEN) + " allowed");
    }

    uchar lastByte = static_cast<uchar>(data.back());
    if (lastByte != 0)
    {
        throw MalformedNameError("NetBIOS name was expected to end with the root label 0, got " +
                                 to_string(lastByte));
    }

    nbns::debug::logBuffer("NbName::fromBytes", "Decoding", data);

    const char* buffer = data.data();
    const char* end = data.data() + data.size() - 1; // root label excluded

    uchar length = static_cast<uchar>(*buffer++);
    if (length != ENCODED_LEN)
    {
        throw MalformedNameError("NetBIOS name was expected to have " + to_string(ENCODED_LEN) +
                                 " encoded bytes, length byte says " + to_string(length));
    }

    if (end - buffer < static_cast<ptrdiff_t>(ENCODED_LEN))
    {
        throw MalformedNameError("NetBIOS name is truncated: " + to_string(end - buffer) +
                                 " encoded bytes before the root label, " +
                                 to_string(ENCODED_LEN) + " expected");
    }

    string full;
    full.reserve(FULL_LEN);
    for (size_t i = 0; i < FULL_LEN; ++i)
    {
        full.push_back(static_cast<char>(decode_word(buffer[0], buffer[1])));
        buffer += 2;
    }

    string value;
    if (full[0] == WILDCARD)
    {
        value.assign(1, WILDCARD);
    }
    else
    {
        value = full.substr(0, VALUE_LEN);
        value.erase(value.find_last_not_of(' ') + 1);
    }
    uchar purpose = static_cast<uchar>(full[VALUE_LEN]);

    vector<string> labels;
    while (buffer < end)
    {
        uchar labelLength = static_cast<uchar>(*buffer++);
        if (labelLength == 0 || labelLength > MAX_LABEL_LEN)
        {
            throw MalformedNameError("NetBIOS scope label length " + to_string(labelLength) +
                                     " is invalid");
        }

        if (end - buffer < labelLength)
        {
            throw MalformedNameError("NetBIOS scope label of " + to_string(labelLength) +
                                     " bytes runs past the end of the name");
        }

        string label(buffer, labelLength);
        if (label.find('.') != string::npos)
        {
            throw MalformedNameError("NetBIOS scope label '" + label + "' holds a '.'");
        }

        labels.push_back(label);
        buffer += labelLength;
    }

    NbName name(value, joinLabels(labels), purpose);

    nbns::debug::log("NbName::fromBytes", "Decoded " + name.asString());

    return name;
}


void NbName::encode_byte(std::string& buffer, uchar value)
{
    buffer.push_back(static_cast<char>('A' + ((value >> 4) & 0x0F)));
    buffer.push_back(static_cast<char>('A' + (value & 0x0F)));
}


uchar NbName::decode_word(char hi, char lo)
{
    if (hi < 'A' || hi > 'P' || lo < 'A' || lo > 'P')
    {
        throw MalformedNameError(string("NetBIOS name holds '") + hi + lo +
                                 "', encoded bytes must be in 'A'..'P'");
    }

    return static_cast<uchar>(((hi - 'A') << 4) | (lo - 'A'));
}
