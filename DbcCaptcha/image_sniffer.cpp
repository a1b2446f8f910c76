#include "image_sniffer.h"

#include <cstring>

static bool HasPrefix(const unsigned char* Bytes, size_t Length, size_t Offset, const char* Magic, size_t MagicLength)
{
	if (Length < Offset + MagicLength) {
		return false;
	}
	return std::memcmp(Bytes + Offset, Magic, MagicLength) == 0;
}

ImageFormat ImageSniffer::Classify(const std::string& Bytes)
{
	return Classify(reinterpret_cast<const unsigned char*>(Bytes.data()), Bytes.size());
}

ImageFormat ImageSniffer::Classify(const unsigned char* Bytes, size_t Length)
{
	if (!Bytes || !Length) {
		return ImageFormat::Unknown;
	}

	if (HasPrefix(Bytes, Length, 0, "\x89PNG\r\n\x1a\n", 8)) {
		return ImageFormat::Png;
	}

	// FF D8 FF E0 (JFIF) or FF D8 FF E1 (Exif), identifier after the segment length
	if (HasPrefix(Bytes, Length, 0, "\xFF\xD8\xFF\xE0", 4) && HasPrefix(Bytes, Length, 6, "JFIF", 4)) {
		return ImageFormat::Jpeg;
	}
	if (HasPrefix(Bytes, Length, 0, "\xFF\xD8\xFF\xE1", 4) && HasPrefix(Bytes, Length, 6, "Exif", 4)) {
		return ImageFormat::Jpeg;
	}

	if (HasPrefix(Bytes, Length, 0, "GIF87a", 6) || HasPrefix(Bytes, Length, 0, "GIF89a", 6)) {
		return ImageFormat::Gif;
	}

	if (HasPrefix(Bytes, Length, 0, "BM", 2)) {
		return ImageFormat::Bmp;
	}

	if (HasPrefix(Bytes, Length, 0, "RIFF", 4) && HasPrefix(Bytes, Length, 8, "WEBP", 4)) {
		return ImageFormat::Webp;
	}

	return ImageFormat::Unknown;
}

const char* ImageSniffer::FormatName(ImageFormat Format)
{
	switch (Format) {
	case ImageFormat::Png:
		return "png";
	case ImageFormat::Jpeg:
		return "jpeg";
	case ImageFormat::Gif:
		return "gif";
	case ImageFormat::Bmp:
		return "bmp";
	case ImageFormat::Webp:
		return "webp";
	case ImageFormat::Unknown:
		break;
	}
	return "unknown";
}

const char* ImageSniffer::MimeType(ImageFormat Format)
{
	switch (Format) {
	case ImageFormat::Png:
		return "image/png";
	case ImageFormat::Jpeg:
		return "image/jpeg";
	case ImageFormat::Gif:
		return "image/gif";
	case ImageFormat::Bmp:
		return "image/bmp";
	case ImageFormat::Webp:
		return "image/webp";
	case ImageFormat::Unknown:
		break;
	}
	return "application/octet-stream";
}

const char* ImageSniffer::FileExtension(ImageFormat Format)
{
	switch (Format) {
	case ImageFormat::Jpeg:
		return "jpg";
	case ImageFormat::Unknown:
		return "bin";
	default:
		return FormatName(Format);
	}
}
