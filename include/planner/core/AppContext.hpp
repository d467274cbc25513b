#pragma once

#include <memory>

namespace planner {
namespace data {
class TaskStore;
}

namespace core {

class Clock;
class DateParser;
class IdGenerator;
class SchedulingEngine;

class AppContext
{
public:
    AppContext();
    AppContext(std::unique_ptr<Clock> clock, std::unique_ptr<IdGenerator> idGenerator);
    ~AppContext();

    AppContext(const AppContext &) = delete;
    AppContext &operator=(const AppContext &) = delete;

    SchedulingEngine &engine();

private:
    std::unique_ptr<Clock> m_clock;
    std::unique_ptr<IdGenerator> m_idGenerator;
    std::unique_ptr<DateParser> m_dateParser;
    std::unique_ptr<data::TaskStore> m_taskStore;
    std::unique_ptr<SchedulingEngine> m_engine;
};

} // namespace core
} // namespace planner
