#pragma once

#include "disnorm/cli.hpp"
#include "disnorm/config.hpp"
#include "disnorm/disassembly.hpp"
#include "disnorm/error.hpp"
#include "disnorm/format.hpp"
#include "disnorm/instruction.hpp"
#include "disnorm/json.hpp"
#include "disnorm/objdump.hpp"
#include "disnorm/section.hpp"
#include "disnorm/symbol.hpp"
#include "disnorm/utils.hpp"
