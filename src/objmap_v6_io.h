#pragma once

#include <string>

#include "objmap_io_common.h"
#include "objmap_types.h"

namespace objmap::v6
{

    // Pre-7 header: width, height, depth, object count. Also used for the
    // older revisions (1..5), which share the layout.
    bool decode_header(detail::ByteReader &reader, MapHeader &out, std::string &err);

} // namespace objmap::v6
