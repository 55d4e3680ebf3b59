#pragma once

#include <string>

#include "objmap_io_common.h"
#include "objmap_types.h"

namespace objmap::v7
{

    // Version 7 adds a volume count after the object count.
    bool decode_header(detail::ByteReader &reader, MapHeader &out, std::string &err);

} // namespace objmap::v7
