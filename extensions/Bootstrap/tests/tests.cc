#define CATCH_CONFIG_RUNNER
#include <catch.hpp>

#include <string>
#include <cstring>
#include "Debug.h"
#include "Exceptions.h"
// --------------------------------------------------------------------------
using namespace std;
using namespace ostack;
// --------------------------------------------------------------------------
int main(int argc, const char* argv[] )
{
    try
    {
        Catch::Session session;

        if( argc > 1 && ( strcmp(argv[1], "--help") == 0 || strcmp(argv[1], "-h") == 0 ) )
        {
            cout << "obstack-bootstrap tests" << endl;
            cout << endl << endl << "--------------- CATCH HELP --------------" << endl;
            session.showHelp();
            return 0;
        }

        int returnCode = session.applyCommandLine( argc, argv );

        if( returnCode != 0 ) // Indicates a command line error
            return returnCode;

        return session.run();
    }
    catch( const ostack::Exception& ex )
    {
        cerr << "(tests): " << ex << endl;
    }
    catch( const std::exception& e )
    {
        cerr << "(tests): " << e.what() << endl;
    }

    return 1;
}
