#include <cctype>
#include <sstream>
#include <stdexcept>

#include "instance_color.hpp"

using namespace std;
using namespace cv;

InstanceColor::InstanceColor(void) :
	r_(0),
	g_(0),
	b_(0)
{
}

InstanceColor::InstanceColor(int r, int g, int b) :
	r_(r),
	g_(g),
	b_(b)
{
	if ((r < 0) || (r > 255) || (g < 0) || (g > 255) || (b < 0) || (b > 255))
	{
		stringstream ss;
		ss << "color component out of range 0-255 : (" << r << ", " << g << ", " << b << ")";
		throw invalid_argument(ss.str());
	}
}

bool InstanceColor::isBackground(void) const
{
	return (r_ == 0) && (g_ == 0) && (b_ == 0);
}

string InstanceColor::key(void) const
{
	stringstream ss;
	ss << "(" << r_ << ", " << g_ << ", " << b_ << ")";
	return ss.str();
}

// Reads a single 0-255 integer, skipping leading spaces.
static bool readComponent(istringstream &is, int &value)
{
	is >> ws;
	if (!isdigit(is.peek()))
		return false;
	is >> value;
	return !is.fail() && (value >= 0) && (value <= 255);
}

static bool readSeparator(istringstream &is, char sep)
{
	is >> ws;
	return is.get() == sep;
}

bool InstanceColor::fromKey(const string &str, InstanceColor &color)
{
	istringstream is(str);
	int r, g, b;
	if (!readSeparator(is, '(') ||
		!readComponent(is, r) || !readSeparator(is, ',') ||
		!readComponent(is, g) || !readSeparator(is, ',') ||
		!readComponent(is, b) || !readSeparator(is, ')'))
	{
		return false;
	}
	// Nothing but whitespace allowed after the closing paren
	is >> ws;
	if (!is.eof())
		return false;

	color = InstanceColor(r, g, b);
	return true;
}

Vec3b InstanceColor::toBGR(void) const
{
	return Vec3b((uchar)b_, (uchar)g_, (uchar)r_);
}

Scalar InstanceColor::toScalar(void) const
{
	return Scalar(b_, g_, r_);
}

InstanceColor InstanceColor::fromBGR(const Vec3b &bgr)
{
	return InstanceColor(bgr[2], bgr[1], bgr[0]);
}

bool InstanceColor::operator==(const InstanceColor &other) const
{
	return (r_ == other.r_) && (g_ == other.g_) && (b_ == other.b_);
}

bool InstanceColor::operator!=(const InstanceColor &other) const
{
	return !(*this == other);
}

bool InstanceColor::operator<(const InstanceColor &other) const
{
	if (r_ != other.r_)
		return r_ < other.r_;
	if (g_ != other.g_)
		return g_ < other.g_;
	return b_ < other.b_;
}

ostream &operator<<(ostream &os, const InstanceColor &color)
{
	return os << color.key();
}

vector<InstanceColor> defaultPalette(void)
{
	vector<InstanceColor> palette;
	palette.push_back(InstanceColor(255, 0, 0));
	palette.push_back(InstanceColor(0, 255, 0));
	palette.push_back(InstanceColor(0, 0, 255));
	return palette;
}
