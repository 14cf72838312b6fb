#ifndef VERSION_H
#define VERSION_H

namespace AutoVersion
{
	static const char NAME[] = "facecut";

	//Software Status
	static const char STATUS[] = "Beta";
	static const char STATUS_SHORT[] = "b";

	//Standard Version Type
	static const long MAJOR = 0;
	static const long MINOR = 4;
	static const long BUILD = 1;
	static const char FULLVERSION_STRING[] = "0.4.1";
}
#endif //VERSION_H
