/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the imagio
	distribution for more details.
*/

//
// Created by nestal on 2/28/18.
//

#pragma once

#include "common/util/BufferView.hh"
#include "common/util/Size2D.hh"

#include <opencv2/core.hpp>

#include <string_view>
#include <system_error>

namespace imagio {

enum class Encoding
{
	jpeg,
	png
};

std::string_view mime(Encoding enc);

/// Decode an image without dropping its alpha channel or its bit depth.
/// Empty or zero-sized images are reported as Error::decode_error.
cv::Mat load_image(BufferView raw, std::error_code& ec);

/// Images with alpha channels or 16-bit channels must be encoded losslessly.
Encoding select_encoding(const cv::Mat& source);

Blob encode_image(const cv::Mat& image, Encoding enc, int jpeg_quality, std::error_code& ec);

inline Size2D dimension(const cv::Mat& image) {return {image.cols, image.rows};}

} // end of namespace imagio
