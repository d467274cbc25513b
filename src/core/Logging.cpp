#include "planner/core/Logging.hpp"

Q_LOGGING_CATEGORY(lcPlannerEngine, "planner.engine")
Q_LOGGING_CATEGORY(lcPlannerStore, "planner.store")
Q_LOGGING_CATEGORY(lcPlannerStorage, "planner.storage")
Q_LOGGING_CATEGORY(lcPlannerApp, "planner.app")
