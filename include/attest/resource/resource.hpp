#pragma once

/// @file resource.hpp
/// @brief Main include file for attest_resource module

#include "fwd.hpp"

// Pure path handling
#include "normalizer.hpp"
#include "resolution.hpp"

// Filesystem and archives
#include "archive.hpp"
#include "temp_files.hpp"
#include "project_layout.hpp"
#include "root_resolver.hpp"
#include "locator.hpp"

// Resource content
#include "fhir_document.hpp"
#include "cross_reference.hpp"
#include "leftover.hpp"

/// @namespace attest_resource
/// @brief Resource roots, reference location and FHIR content lookups
