/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 3/13/24.
//

#include "ImageRecord.hh"

#include <nlohmann/json.hpp>

#include <array>
#include <utility>

namespace imagio {

std::string_view extension(std::string_view mime)
{
	static const std::array<std::pair<std::string_view, std::string_view>, 7> table{{
		{"image/jpeg",  "JPG"},
		{"image/png",   "PNG"},
		{"image/gif",   "GIF"},
		{"image/webp",  "WEBP"},
		{"image/bmp",   "BMP"},
		{"image/x-ms-bmp", "BMP"},
		{"image/tiff",  "TIFF"}
	}};

	for (auto&& [type, ext] : table)
		if (type == mime)
			return ext;

	return "BIN";
}

void to_json(nlohmann::json& dest, const ImageRecord& src)
{
	dest = nlohmann::json{
		{"uuid",     src.uuid()},
		{"category", src.category()},
		{"mime",     src.mime()},
		{"created",  src.created()}
	};
}

void from_json(const nlohmann::json& src, ImageRecord& dest)
{
	dest = ImageRecord{
		src.at("uuid").get<std::string>(),
		src.at("category").get<std::string>(),
		src.at("mime").get<std::string>(),
		src.at("created").get<Timestamp>()
	};
}

} // end of namespace imagio
