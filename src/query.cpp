#include "query.hpp"
#include "debugLog.hpp"

using namespace std;
using namespace nbns;


string nbns::buildQuestionEntry(const NbName& name, uint qType, uint qClass)
{
    string buffer = name.toBytes();

    put16bits(buffer, qType);
    put16bits(buffer, qClass);

    return buffer;
}


Request::Request(const NbName& questionName, uint questionType, uint questionClass) 
: m_questionName(questionName)
, m_questionType(questionType)
, m_questionClass(questionClass)
{
}


string Request::code() const
{
    string buffer = buildQuestionEntry(m_questionName, m_questionType, m_questionClass);

    nbns::debug::log("Request::code",
                     "Question " + m_questionName.asString() + " type " + 
                         to_string(m_questionType) + " class " + to_string(m_questionClass) + 
                         " is " + to_string(buffer.size()) + " bytes");

    return buffer;
}


nlohmann::json Request::toJson() const
{
    nlohmann::json description;
    description["question_name"] = m_questionName.toJson();
    description["question_type"] = m_questionType;
    description["question_class"] = m_questionClass;
    return description;
}
