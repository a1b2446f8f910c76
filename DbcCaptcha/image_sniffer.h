#pragma once

#include <string>

enum class ImageFormat {
	Unknown,
	Png,
	Jpeg,
	Gif,
	Bmp,
	Webp
};

// Recognizes image uploads by their leading magic bytes.
class ImageSniffer {
public:
	static ImageFormat Classify(const std::string& Bytes);
	static ImageFormat Classify(const unsigned char* Bytes, size_t Length);

	static const char* FormatName(ImageFormat Format);
	static const char* MimeType(ImageFormat Format);
	static const char* FileExtension(ImageFormat Format);
};
