#ifndef MBLogSugar_H_
#define MBLogSugar_H_
// короткая запись для логов кодека
// (в классе должен быть std::shared_ptr<DebugStream> mblog)
#ifndef mbwarn
#define mbwarn if( mblog->is_warn() ) mblog->warn()
#endif
#ifndef mblog3
#define mblog3 if( mblog->is_level3() ) mblog->level3()
#endif
#ifndef mblog9
#define mblog9 if( mblog->is_level9() ) mblog->level9()
#endif
#endif
