/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>

    This file is subject to the terms and conditions of the GNU General Public
    License.  See the file COPYING in the main directory of the imagio
    distribution for more details.
*/

//
// Created by nestal on 6/25/18.
//

#include "TestImages.hh"

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace imagio {

cv::Mat random_image(Size2D size, int type)
{
	cv::Mat image{size.height(), size.width(), type};

	auto max = CV_MAT_DEPTH(type) == CV_16U ? 65535.0 : 255.0;
	cv::randu(image, cv::Scalar::all(0), cv::Scalar::all(max));
	return image;
}

Blob random_jpeg(Size2D size, int quality)
{
	Blob out_buf;
	cv::imencode(".jpg", random_image(size), out_buf, {cv::IMWRITE_JPEG_QUALITY, quality});
	return out_buf;
}

Blob random_png(Size2D size, int type)
{
	Blob out_buf;
	cv::imencode(".png", random_image(size, type), out_buf);
	return out_buf;
}

} // end of namespace
