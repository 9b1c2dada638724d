/*
	Copyright © 2024 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 3/10/24.
//

#include "Transform.hh"
#include "Image.hh"

#include "common/Error.hh"
#include "common/util/Log.hh"

#include <opencv2/imgproc.hpp>

#include <cassert>

namespace imagio {

Transform::Transform(int jpeg_quality) : m_jpeg_quality{jpeg_quality}
{
}

Blob Transform::operator()(BufferView original, Variant variant, std::error_code& ec) const
{
	auto source = load_image(original, ec);
	if (ec)
	{
		Log(LOG_WARNING, "cannot decode original image (%1% bytes) for %2% rendition", original.size(), variant);
		return {};
	}
	return (*this)(source, variant, ec);
}

Blob Transform::operator()(const cv::Mat& source, Variant variant, std::error_code& ec) const
{
	// original is never rendered. It should be handled before reaching here.
	assert(variant != Variant::original);

	if (source.empty() || source.cols <= 0 || source.rows <= 0)
	{
		ec = Error::decode_error;
		return {};
	}

	auto src_size = dimension(source);
	auto dest     = target_size(variant, src_size);

	cv::Mat out;
	if (dest == src_size)
		out = source;
	else
		cv::resize(source, out, cv::Size{dest.width(), dest.height()}, 0, 0, cv::INTER_AREA);

	// decide by the source, not the resized image
	auto enc = select_encoding(source);

	Log(LOG_DEBUG, "rendering %1% variant: %2% -> %3% (%4%)", variant, src_size, dest, mime(enc));
	return encode_image(out, enc, m_jpeg_quality, ec);
}

} // end of namespace imagio
