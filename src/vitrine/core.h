#ifndef VITRINE_CORE_H
#define VITRINE_CORE_H

#include <vitrine/core/exception.hpp>
#include <vitrine/core/monitoring.hpp>
#include <vitrine/core/type_definitions.hpp>

#endif
