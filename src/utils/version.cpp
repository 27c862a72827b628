#include "sheetsapi/utils/version.hpp"

namespace sheetsapi {

std::string getVersion() {
#ifdef SHEETSAPI_VERSION
	return SHEETSAPI_VERSION;
#else
	return "";
#endif
}

} // namespace sheetsapi
