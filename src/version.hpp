#ifndef _version_hpp_INCLUDED
#define _version_hpp_INCLUDED

namespace Refuter {

const char * version ();
const char * compiler ();
const char * date ();

}

#endif
