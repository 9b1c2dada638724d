/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 3/13/24.
//

#pragma once

#include "common/Timestamp.hh"

#include <nlohmann/json_fwd.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace imagio {

/// \brief  Metadata of one uploaded image.
/// The uuid is assigned when the image is uploaded and denotes exactly one
/// immutable original byte stream.
class ImageRecord
{
public:
	ImageRecord() = default;
	ImageRecord(std::string uuid, std::string category, std::string mime, Timestamp created = Timestamp::now()) :
		m_uuid{std::move(uuid)}, m_category{std::move(category)}, m_mime{std::move(mime)}, m_created{created}
	{
	}

	[[nodiscard]] auto& uuid() const noexcept {return m_uuid;}
	[[nodiscard]] auto& category() const noexcept {return m_category;}
	[[nodiscard]] auto& mime() const noexcept {return m_mime;}
	[[nodiscard]] auto created() const noexcept {return m_created;}

	bool operator==(const ImageRecord&) const = default;

private:
	std::string m_uuid;
	std::string m_category;
	std::string m_mime;
	Timestamp   m_created{};
};

using ImageRecords = std::vector<ImageRecord>;

/// Upper-case file extension of a MIME type, e.g. "JPG" for "image/jpeg".
/// Unknown types are "BIN".
std::string_view extension(std::string_view mime);

void to_json(nlohmann::json& dest, const ImageRecord& src);
void from_json(const nlohmann::json& src, ImageRecord& dest);

} // end of namespace imagio
