#pragma once

#include <QString>

namespace planner {
namespace core {

class IdGenerator
{
public:
    virtual ~IdGenerator() = default;

    virtual QString newId() = 0;
};

class UuidGenerator : public IdGenerator
{
public:
    QString newId() override;
};

} // namespace core
} // namespace planner
