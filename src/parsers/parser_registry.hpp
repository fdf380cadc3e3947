// parser_registry.hpp
#pragma once
#include "base_parser.hpp"
#include "registry.hpp"

using ParserRegistry = Registry<BaseParser>;

#define REGISTER_PARSER(CLASSNAME) REGISTER_COMPONENT(ParserRegistry, CLASSNAME)
