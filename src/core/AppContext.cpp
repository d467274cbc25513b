#include "planner/core/AppContext.hpp"

#include <utility>

#include "planner/core/Clock.hpp"
#include "planner/core/DateParser.hpp"
#include "planner/core/IdGenerator.hpp"
#include "planner/core/SchedulingEngine.hpp"
#include "planner/data/TaskStore.hpp"

namespace planner {
namespace core {

AppContext::AppContext()
    : AppContext(std::make_unique<SystemClock>(), std::make_unique<UuidGenerator>())
{
}

AppContext::AppContext(std::unique_ptr<Clock> clock, std::unique_ptr<IdGenerator> idGenerator)
    : m_clock(std::move(clock))
    , m_idGenerator(std::move(idGenerator))
    , m_dateParser(std::make_unique<QtDateParser>(*m_clock))
    , m_taskStore(std::make_unique<data::TaskStore>())
    , m_engine(std::make_unique<SchedulingEngine>(*m_taskStore, *m_clock, *m_dateParser, *m_idGenerator))
{
}

AppContext::~AppContext() = default;

SchedulingEngine &AppContext::engine()
{
    return *m_engine;
}

} // namespace core
} // namespace planner
