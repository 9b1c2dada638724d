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

#include "Variant.hh"

#include "common/util/BufferView.hh"

#include <opencv2/core.hpp>

#include <system_error>

namespace imagio {

/// \brief  Renders a derived variant from the bytes of an original.
/// The output dimension is given by target_size() and the output encoding is
/// chosen by select_encoding() on the decoded source, so all variants of the
/// same original share the same encoding.
class Transform
{
public:
	explicit Transform(int jpeg_quality = 85);

	Blob operator()(BufferView original, Variant variant, std::error_code& ec) const;
	Blob operator()(const cv::Mat& source, Variant variant, std::error_code& ec) const;

	[[nodiscard]] int jpeg_quality() const {return m_jpeg_quality;}

private:
	int m_jpeg_quality;
};

} // end of namespace imagio
