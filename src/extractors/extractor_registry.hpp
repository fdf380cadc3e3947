// extractor_registry.hpp
#pragma once
#include "base_extractor.hpp"
#include "registry.hpp"

using ExtractorRegistry = Registry<BaseExtractor>;

#define REGISTER_EXTRACTOR(CLASSNAME) REGISTER_COMPONENT(ExtractorRegistry, CLASSNAME)
