#define MAJOR_VER	1
#define MINOR_VER	0
#define RELEASE_VER	2

#ifndef BUILD_VER
#define BUILD_VER	0
#endif

#define ORG "Estonian ID Card"
#define APP "isikukood"
#define DOMAINURL "eesti.ee"
