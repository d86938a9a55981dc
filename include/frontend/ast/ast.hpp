#pragma once

#include "frontend/ast/types.hpp"
#include "frontend/ast/expressions.hpp"
#include "frontend/ast/members.hpp"
#include "frontend/ast/program.hpp"
