/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/10/24.
//

#pragma once

#include "common/util/Size2D.hh"

#include <array>
#include <iosfwd>
#include <string_view>

namespace imagio {

/// \brief The renditions of an image that can be requested.
/// original is the uploaded byte stream. All the others are rendered from it
/// on demand and cached.
enum class Variant
{
	original,
	public_,
	embed,
	thumb,
	banner,
	square
};

/// All variants that are rendered from the original
constexpr std::array<Variant, 5> derived_variants{
	Variant::public_, Variant::embed, Variant::thumb, Variant::banner, Variant::square
};

std::string_view to_string(Variant variant);

/// Unknown names fall back to Variant::original.
Variant parse_variant(std::string_view name);

/// Target box of a derived variant. Only embed depends on the source dimension.
/// \pre    variant != Variant::original and source is not empty
Size2D bounding_box(Variant variant, Size2D source);

/// Scale \a source down to fit inside \a box, keeping its aspect ratio.
/// Never enlarges and never crops.
Size2D fit_into(Size2D source, Size2D box);

/// Dimension of the rendered variant of an image of size \a source
Size2D target_size(Variant variant, Size2D source);

std::ostream& operator<<(std::ostream& os, Variant variant);

} // end of namespace imagio
