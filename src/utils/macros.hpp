
/******************************************************************************/
/*  resync Internal Use                                                       */
/******************************************************************************/

#define LIBRESYNC_UNUSED(object) (void) object
#define LIBRESYNC_DELETE(p_object)                                             \
    {                                                                          \
        delete p_object;                                                       \
        p_object = 0;                                                          \
    }

/******************************************************************************/

#if !defined RESYNC_NOEXCEPT
#define RESYNC_NOEXCEPT noexcept
#endif

#if !defined RESYNC_OVERRIDE
#define RESYNC_OVERRIDE override
#endif

#if !defined RESYNC_FINAL
#define RESYNC_FINAL final
#endif

#if !defined RESYNC_DEFAULT
#define RESYNC_DEFAULT = default;
#endif

#if !defined RESYNC_NON_COPYABLE_NOR_MOVABLE
#define RESYNC_NON_COPYABLE_NOR_MOVABLE(classname)                             \
  public:                                                                      \
    classname (const classname &) = delete;                                    \
    classname &operator= (const classname &) = delete;                         \
    classname (classname &&) = delete;                                         \
    classname &operator= (classname &&) = delete;
#endif
