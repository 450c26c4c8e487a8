/*
 * Copyright (c) 2014, AirBitz, Inc.
 * All rights reserved.
 *
 * See the LICENSE file for more information.
 */

#include "Data.hpp"

namespace sendcore {

std::string
toString(DataSlice slice)
{
    return std::string(reinterpret_cast<const char *>(slice.data()),
                       slice.size());
}

} // namespace sendcore
