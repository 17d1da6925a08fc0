#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "name.hpp"


namespace nbns 
{

enum QuestionType { TypeNb=0x0020, TypeNbStat=0x0021 };
enum QuestionClass { ClassIn=0x0001 };

// QUESTION_NAME | QUESTION_TYPE | QUESTION_CLASS, RFC 1002 section 4.2.1.2.
std::string buildQuestionEntry(const NbName& name, uint qType, uint qClass);

// Body of a request: a single question entry, no resource records.
class Request 
{
public:

    Request(const NbName& questionName, uint questionType, uint questionClass = ClassIn);

    std::string code() const;

    nlohmann::json toJson() const;

    const NbName& getQuestionName() const { return m_questionName; }
    uint getQuestionType() const { return m_questionType; }
    uint getQuestionClass() const { return m_questionClass; }

private:
    NbName m_questionName;
    uint m_questionType;
    uint m_questionClass;
};

}
