/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 2/28/18.
//

#include "Image.hh"

#include "common/Error.hh"
#include "common/util/Log.hh"

#include <opencv2/imgcodecs.hpp>

#include <limits>

namespace imagio {

std::string_view mime(Encoding enc)
{
	return enc == Encoding::png ? "image/png" : "image/jpeg";
}

cv::Mat load_image(BufferView raw, std::error_code& ec)
{
	if (raw.empty() || raw.size() > static_cast<std::size_t>(std::numeric_limits<int>::max()))
	{
		ec = Error::decode_error;
		return {};
	}

	cv::Mat image;
	try
	{
		image = cv::imdecode(
			cv::Mat{1, static_cast<int>(raw.size()), CV_8U, const_cast<unsigned char*>(raw.data())},
			cv::IMREAD_UNCHANGED
		);
	}
	catch (cv::Exception& e)
	{
		Log(LOG_WARNING, "cv::imdecode() failed: %1%", e.what());
		image.release();
	}

	if (image.empty() || image.cols <= 0 || image.rows <= 0)
	{
		ec = Error::decode_error;
		return {};
	}

	ec.clear();
	return image;
}

Encoding select_encoding(const cv::Mat& source)
{
	// 2-channel images are grey+alpha
	auto has_alpha = source.channels() == 4 || source.channels() == 2;
	auto is_16bit  = source.depth() == CV_16U;

	return has_alpha || is_16bit ? Encoding::png : Encoding::jpeg;
}

Blob encode_image(const cv::Mat& image, Encoding enc, int jpeg_quality, std::error_code& ec)
{
	Blob out_buf;
	try
	{
		auto success = enc == Encoding::png ?
			cv::imencode(".png", image, out_buf) :
			cv::imencode(".jpg", image, out_buf, {cv::IMWRITE_JPEG_QUALITY, jpeg_quality});

		if (success && !out_buf.empty())
		{
			ec.clear();
			return out_buf;
		}
	}
	catch (cv::Exception& e)
	{
		Log(LOG_WARNING, "cv::imencode() failed: %1%", e.what());
	}

	// the pixel format of the source is not supported by the encoder
	ec = Error::decode_error;
	return {};
}

} // end of namespace imagio
