#pragma once

// Convenience header for library users

#include "config.hpp"
#include "csv_entry.hpp"
#include "entry.hpp"
#include "entry_tree.hpp"
#include "field.hpp"
#include "file_entry.hpp"
#include "image_builder.hpp"
#include "json_entry.hpp"
#include "log.hpp"
#include "mapping_entry.hpp"
#include "types.hpp"
#include "zip_reader.hpp"
