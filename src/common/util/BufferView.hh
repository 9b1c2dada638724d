/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 7/14/18.
//

#pragma once

#include <span>
#include <vector>

namespace imagio {

using Blob       = std::vector<unsigned char>;
using BufferView = std::span<const unsigned char>;

} // end of namespace imagio
