/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/10/24.
//

#include "Variant.hh"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <ostream>

namespace imagio {

std::string_view to_string(Variant variant)
{
	switch (variant)
	{
		case Variant::original: return "original";
		case Variant::public_:  return "public";
		case Variant::embed:    return "embed";
		case Variant::thumb:    return "thumb";
		case Variant::banner:   return "banner";
		case Variant::square:   return "square";
	}
	return "original";
}

Variant parse_variant(std::string_view name)
{
	for (auto variant : derived_variants)
		if (name == to_string(variant))
			return variant;

	return Variant::original;
}

Size2D bounding_box(Variant variant, Size2D source)
{
	assert(!source.empty());
	switch (variant)
	{
		case Variant::public_:  return {1024, 768};
		case Variant::thumb:    return {256, 256};
		case Variant::banner:   return {800, 400};
		case Variant::square:   return {320, 320};
		case Variant::embed:
		{
			// keep the aspect ratio of the source, but no wider than 1024
			std::int64_t width = std::min(source.width(), 1024);
			return {
				static_cast<int>(width),
				static_cast<int>(source.height() * width / source.width())
			};
		}

		case Variant::original: break;
	}

	assert(variant != Variant::original);
	return source;
}

Size2D fit_into(Size2D source, Size2D box)
{
	std::int64_t sw = source.width(), sh = source.height();
	std::int64_t bw = box.width(),    bh = box.height();

	if (sw <= bw && sh <= bh)
		return source;

	// width-limited
	if (sw > bw)
	{
		auto h = sh * bw / sw;
		if (h <= bh)
			return {static_cast<int>(bw), static_cast<int>(std::max<std::int64_t>(h, 1))};
	}

	// height-limited
	return {static_cast<int>(std::max<std::int64_t>(sw * bh / sh, 1)), static_cast<int>(bh)};
}

Size2D target_size(Variant variant, Size2D source)
{
	return fit_into(source, bounding_box(variant, source));
}

std::ostream& operator<<(std::ostream& os, Variant variant)
{
	return os << to_string(variant);
}

} // end of namespace imagio
